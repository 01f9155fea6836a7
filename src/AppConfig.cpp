#include "jellyfin_backup/AppConfig.hpp"
#include "jellyfin_backup/Paths.hpp"
#include "platform/PlatformImpl.hpp"

namespace jfbak {

	//------------------------------------------------------------
	//	Сборка конфигурации: платформа + командная строка
	//------------------------------------------------------------
	AppConfig makeConfig(const CliOptions& opt) {

		AppConfig cfg;
		const fs::path self = selfDir();

		cfg.dataDirCandidates = dataDirCandidates(opt.dataDir);

		cfg.selfExe = selfExe();
		cfg.logDir = self / "log";

		cfg.toolDir = resolveAgainstSelf(opt.toolDir, self / "7zip");
		cfg.toolUrl = opt.toolUrl.empty() ? platform::defaultToolUrl() : opt.toolUrl;
		cfg.toolExeNames = platform::archiverExeNames();

		cfg.backupDir = resolveAgainstSelf(opt.backupDir, self / "Backups");

		cfg.serviceName = opt.serviceName.empty() ? platform::defaultServiceName() : opt.serviceName;
		cfg.processName = platform::defaultProcessName();
		cfg.userExe = platform::defaultUserExe();

		if (opt.noDelay) cfg.settleDelay = std::chrono::milliseconds(0);

		return cfg;
	}

}; //---namespace jfbak
