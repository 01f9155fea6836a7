#include "jellyfin_backup/App.hpp"
#include "jellyfin_backup/AppConfig.hpp"
#include "jellyfin_backup/ArchiveToolProvisioner.hpp"
#include "jellyfin_backup/BackupExecutor.hpp"
#include "jellyfin_backup/CommandRunner.hpp"
#include "jellyfin_backup/Downloader.hpp"
#include "jellyfin_backup/IProcessControl.hpp"
#include "jellyfin_backup/IServiceBackend.hpp"
#include "jellyfin_backup/ITaskScheduler.hpp"
#include "jellyfin_backup/Logging.hpp"
#include "jellyfin_backup/Menu.hpp"
#include "jellyfin_backup/Paths.hpp"
#include "jellyfin_backup/Platform.hpp"
#include "jellyfin_backup/RestoreExecutor.hpp"
#include "jellyfin_backup/ScheduleManager.hpp"
#include "jellyfin_backup/ServiceController.hpp"

#include <iostream>
#include <glog/logging.h>

namespace jfbak {

	//------------------------------------------------------------
	//	Логирование ошибки и возврат кода ошибки
	//------------------------------------------------------------
	static int fail(const std::string& msg) {
		LOG(ERROR) << msg;
		return 1;
	}

	//------------------------------------------------------------
	//	Оркестратор: конфигурация → каталог данных → компоненты → режим работы
	//------------------------------------------------------------
	int runApp(const CliOptions& opt, const char* programName) {

		AppConfig cfg = makeConfig(opt);
		initLogging(programName, cfg.logDir);

		//---Каталог данных определяется один раз
		const auto dataDir = resolveDataDir(cfg.dataDirCandidates);
		if (!dataDir)
		{
			for (const auto& c : cfg.dataDirCandidates) LOG(ERROR) << "Not found: " << c;
			return fail("Jellyfin data directory not found.");
		}
		cfg.dataDir = *dataDir;
		LOG(INFO) << "Jellyfin data directory: " << cfg.dataDir;
		cfg.taskUser = scheduleAccount(cfg.dataDir);

		//---Без прав администратора / root служба и планировщик скорее всего недоступны
		if (!requireAdminRoot())
			LOG(WARNING) << "Not running as Administrator/root: service control and scheduling may fail.";

		//---Бэкенды текущей платформы
		auto serviceBackend = makeServiceBackend();
		auto processControl = makeProcessControl();
		auto taskScheduler = makeTaskScheduler();
		if (!serviceBackend || !processControl || !taskScheduler) return fail("Backend not available on this platform.");

		SystemCommandRunner runner;
		HttpDownloader downloader;
		ArchiveToolProvisioner tools(defaultToolSource(cfg.toolDir, cfg.toolUrl, cfg.toolExeNames), downloader, runner);
		ServiceController service(serviceTargetFrom(cfg), *serviceBackend, *processControl);

		BackupExecutor backup(cfg, service, tools, runner);

		//---Режим планировщика: одна копия в папку по умолчанию
		if (opt.cmd == Command::BackupOnly)
		{
			const BackupResult r = backup.run(DestinationChoice::defaultFolder());
			return r.ok() ? 0 : 1;
		}

		RestoreExecutor restore(cfg, service, tools, runner);
		ScheduleManager schedule(cfg, *taskScheduler);

		runMenu(std::cin, std::cout, backup, restore, schedule);
		return 0;
	}

};//---namespace jfbak
