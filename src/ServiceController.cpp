#include "jellyfin_backup/ServiceController.hpp"
#include "jellyfin_backup/AppConfig.hpp"
#include "jellyfin_backup/IProcessControl.hpp"
#include "jellyfin_backup/IServiceBackend.hpp"

#include <system_error>
#include <thread>
#include <utility>
#include <glog/logging.h>

namespace jfbak {

	const char* toString(StopOutcome o) {
		switch (o)
		{
		case StopOutcome::Stopped: return "stopped";
		case StopOutcome::NotRunning: return "not running";
		case StopOutcome::StopFailed: return "stop failed";
		}
		return "unknown";
	}

	const char* toString(StartOutcome o) {
		switch (o)
		{
		case StartOutcome::Started: return "service started";
		case StartOutcome::Launched: return "process launched";
		case StartOutcome::ManualStartRequired: return "manual start required";
		case StartOutcome::StartFailed: return "start failed";
		}
		return "unknown";
	}

	ServiceTarget serviceTargetFrom(const AppConfig& cfg) {
		ServiceTarget t;
		t.serviceName = cfg.serviceName;
		t.processName = cfg.processName;
		t.userExe = cfg.userExe;
		t.stopTimeout = cfg.stopTimeout;
		t.settleDelay = cfg.settleDelay;
		return t;
	}

	ServiceController::ServiceController(ServiceTarget target, IServiceBackend& backend, IProcessControl& processes)
		: target_(std::move(target)), backend_(backend), processes_(processes)
	{
	}

	//------------------------------------------------------------
	//	Служба зарегистрирована? Ошибка запроса = считаем, что нет
	//------------------------------------------------------------
	bool ServiceController::serviceRegistered()
	{
		if (target_.serviceName.empty()) return false;

		bool exists = false;
		std::string err;
		if (!backend_.exists(target_.serviceName, exists, &err))
		{
			LOG(WARNING) << "Cannot query service '" << target_.serviceName << "': " << err;
			return false;
		}
		return exists;
	}

	StrategyOutcome ServiceController::stopService()
	{
		if (!serviceRegistered()) return StrategyOutcome::NotApplicable;

		std::string err;
		if (!backend_.stop(target_.serviceName, &err))
		{
			LOG(ERROR) << "Failed to stop service '" << target_.serviceName << "': " << err;
			return StrategyOutcome::Failed;
		}
		return StrategyOutcome::Succeeded;
	}

	StrategyOutcome ServiceController::killProcess()
	{
		if (!processes_.isRunning(target_.processName)) return StrategyOutcome::NotApplicable;

		std::string err;
		if (!processes_.killAll(target_.processName, &err))
		{
			LOG(ERROR) << "Failed to terminate " << target_.processName << ": " << err;
			return StrategyOutcome::Failed;
		}
		return StrategyOutcome::Succeeded;
	}

	StrategyOutcome ServiceController::startService()
	{
		if (!serviceRegistered()) return StrategyOutcome::NotApplicable;

		std::string err;
		if (!backend_.start(target_.serviceName, &err))
		{
			LOG(ERROR) << "Failed to start service '" << target_.serviceName << "': " << err;
			return StrategyOutcome::Failed;
		}
		return StrategyOutcome::Succeeded;
	}

	StrategyOutcome ServiceController::launchProcess()
	{
		std::error_code ec;
		if (target_.userExe.empty() || !fs::exists(target_.userExe, ec)) return StrategyOutcome::NotApplicable;

		std::string err;
		if (!processes_.launchDetached(target_.userExe, &err))
		{
			LOG(ERROR) << "Failed to launch " << target_.userExe << ": " << err;
			return StrategyOutcome::Failed;
		}
		return StrategyOutcome::Succeeded;
	}

	//------------------------------------------------------------
	//	Ждём исчезновения процесса, затем фиксированная пауза,
	//	чтобы сервер успел отпустить файлы базы
	//------------------------------------------------------------
	void ServiceController::waitForRelease()
	{
		const auto deadline = std::chrono::steady_clock::now() + target_.stopTimeout;
		while (processes_.isRunning(target_.processName))
		{
			if (std::chrono::steady_clock::now() >= deadline)
			{
				LOG(WARNING) << target_.processName << " is still running after " << target_.stopTimeout.count() << " ms";
				break;
			}
			std::this_thread::sleep_for(target_.pollInterval);
		}

		if (target_.settleDelay.count() > 0) std::this_thread::sleep_for(target_.settleDelay);
	}

	//------------------------------------------------------------
	//	Остановка: служба → процесс
	//------------------------------------------------------------
	StopOutcome ServiceController::stop()
	{
		using Step = StrategyOutcome (ServiceController::*)();
		const std::pair<const char*, Step> steps[] = {
			{ "service", &ServiceController::stopService },
			{ "process", &ServiceController::killProcess },
		};

		bool failed = false;
		for (const auto& [name, step] : steps)
		{
			const StrategyOutcome o = (this->*step)();
			if (o == StrategyOutcome::Succeeded)
			{
				LOG(INFO) << "Jellyfin stopped via " << name;
				waitForRelease();
				return StopOutcome::Stopped;
			}
			if (o == StrategyOutcome::Failed) failed = true;
		}

		if (failed)
		{
			LOG(ERROR) << "Jellyfin could not be stopped";
			return StopOutcome::StopFailed;
		}
		LOG(INFO) << "Jellyfin is not running";
		return StopOutcome::NotRunning;
	}

	//------------------------------------------------------------
	//	Запуск: служба → процесс пользовательской установки
	//------------------------------------------------------------
	StartOutcome ServiceController::start()
	{
		const StrategyOutcome svc = startService();
		if (svc == StrategyOutcome::Succeeded)
		{
			LOG(INFO) << "Jellyfin service '" << target_.serviceName << "' started";
			return StartOutcome::Started;
		}

		const StrategyOutcome proc = launchProcess();
		if (proc == StrategyOutcome::Succeeded)
		{
			LOG(INFO) << "Jellyfin launched: " << target_.userExe;
			return StartOutcome::Launched;
		}

		if (svc == StrategyOutcome::Failed || proc == StrategyOutcome::Failed)
		{
			LOG(ERROR) << "Jellyfin could not be started, start it manually";
			return StartOutcome::StartFailed;
		}
		LOG(WARNING) << "No Jellyfin service or executable found, start Jellyfin manually";
		return StartOutcome::ManualStartRequired;
	}

};//---namespace jfbak
