#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include "Strategy.hpp"

namespace jfbak {

	namespace fs = std::filesystem;

	class IServiceBackend;
	class IProcessControl;
	struct AppConfig;

	enum class StopOutcome {
		Stopped,
		NotRunning,			//	Ни службы, ни процесса
		StopFailed
	};

	enum class StartOutcome {
		Started,			//	Запущена служба
		Launched,			//	Запущен процесс пользовательской установки
		ManualStartRequired,
		StartFailed
	};

	const char* toString(StopOutcome o);
	const char* toString(StartOutcome o);

	//---Остановка / запуск сервера вокруг операций с каталогом данных.
	//	Никогда не бросает исключений: исход возвращается и пишется в журнал
	class IServiceController {
	public:
		virtual ~IServiceController() = default;

		virtual StopOutcome stop() = 0;
		virtual StartOutcome start() = 0;
	};

	//---Что именно останавливаем
	struct ServiceTarget final {
		std::string serviceName;
		std::string processName;
		fs::path userExe;
		std::chrono::milliseconds stopTimeout{ 30000 };		//	Ожидание завершения процесса
		std::chrono::milliseconds pollInterval{ 250 };
		std::chrono::milliseconds settleDelay{ 3000 };		//	Пауза на освобождение файлов
	};

	ServiceTarget serviceTargetFrom(const AppConfig& cfg);

	//---Служба ОС → процесс → ничего
	class ServiceController final : public IServiceController {
	public:
		ServiceController(ServiceTarget target, IServiceBackend& backend, IProcessControl& processes);

		StopOutcome stop() override;
		StartOutcome start() override;

	private:
		//---Стратегии остановки
		StrategyOutcome stopService();
		StrategyOutcome killProcess();
		//---Стратегии запуска
		StrategyOutcome startService();
		StrategyOutcome launchProcess();

		bool serviceRegistered();
		void waitForRelease();

		ServiceTarget target_;
		IServiceBackend& backend_;
		IProcessControl& processes_;
	};

};//---namespace jfbak
