#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include "ServiceController.hpp"

namespace jfbak {

	namespace fs = std::filesystem;

	struct AppConfig;
	class ICommandRunner;
	class IToolProvisioner;

	//---Куда класть архив
	struct DestinationChoice final {
		enum class Kind { Default, Custom };

		Kind kind = Kind::Default;
		fs::path custom;			//	Пусто при Custom → пользователь отменил выбор

		static DestinationChoice defaultFolder() { return {}; }
		static DestinationChoice customFolder(fs::path p) { return { Kind::Custom, std::move(p) }; }
	};

	enum class BackupStatus {
		Succeeded,
		NoDestination,			//	Выбор папки отменён
		DestinationFailed,		//	Папку не удалось создать
		AcquisitionFailed,		//	Нет архиватора
		ArchiveFailed			//	Архиватор не запустился или вернул не 0
	};

	const char* toString(BackupStatus s);

	struct BackupResult final {
		BackupStatus status = BackupStatus::Succeeded;
		fs::path archive;				//	Полный путь к архиву (файл есть только при Succeeded)
		int exitCode = 0;				//	Код архиватора при ArchiveFailed
		std::string error;
		StopOutcome stop = StopOutcome::NotRunning;
		StartOutcome start = StartOutcome::ManualStartRequired;

		bool ok() const { return status == BackupStatus::Succeeded; }
	};

	using Clock = std::function<std::chrono::system_clock::time_point()>;

	//---Остановка → архивирование каталога данных → запуск (всегда)
	class BackupExecutor final {
	public:
		BackupExecutor(const AppConfig& cfg, IServiceController& service, IToolProvisioner& tools,
			ICommandRunner& runner, Clock now = [] { return std::chrono::system_clock::now(); });

		BackupResult run(const DestinationChoice& choice);

	private:
		void archive(const DestinationChoice& choice, BackupResult& r);

		const AppConfig& cfg_;
		IServiceController& service_;
		IToolProvisioner& tools_;
		ICommandRunner& runner_;
		Clock now_;
	};

};//---namespace jfbak
