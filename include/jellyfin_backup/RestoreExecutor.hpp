#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "ServiceController.hpp"

namespace jfbak {

	namespace fs = std::filesystem;

	struct AppConfig;
	class ICommandRunner;
	class IToolProvisioner;

	enum class RestoreStatus {
		Succeeded,
		Cancelled,				//	Архив не выбран: ничего не трогали
		ArchiveMissing,			//	Выбранного файла нет: ничего не трогали
		ClearFailed,			//	Каталог данных не удалось очистить
		AcquisitionFailed,
		ArchiveFailed,
		OwnershipFailed			//	Данные распакованы, но владелец каталога не восстановлен
	};

	const char* toString(RestoreStatus s);

	struct RestoreResult final {
		RestoreStatus status = RestoreStatus::Succeeded;
		int exitCode = 0;
		std::string error;
		bool serviceTouched = false;		//	Были ли вызваны stop/start
		StopOutcome stop = StopOutcome::NotRunning;
		StartOutcome start = StartOutcome::ManualStartRequired;

		bool ok() const { return status == RestoreStatus::Succeeded; }
	};

	//---Остановка → очистка каталога данных → распаковка → запуск (всегда).
	//	Предыдущее содержимое не сохраняется: при ошибке распаковки каталог
	//	остаётся пустым или частично заполненным
	class RestoreExecutor final {
	public:
		RestoreExecutor(const AppConfig& cfg, IServiceController& service, IToolProvisioner& tools,
			ICommandRunner& runner);

		RestoreResult run(const std::optional<fs::path>& archive);

	private:
		void restore(const fs::path& archive, RestoreResult& r);

		const AppConfig& cfg_;
		IServiceController& service_;
		IToolProvisioner& tools_;
		ICommandRunner& runner_;
	};

};//---namespace jfbak
