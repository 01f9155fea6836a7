#include "jellyfin_backup/Platform.hpp"
#include "jellyfin_backup/IServiceBackend.hpp"
#include "jellyfin_backup/IProcessControl.hpp"
#include "jellyfin_backup/ITaskScheduler.hpp"
#include "platform/PlatformImpl.hpp"

namespace jfbak {
	//------------------------------------------------------------
	//	Проверка прав администратора
	//------------------------------------------------------------
	bool requireAdminRoot() {
		return platform::isElevated();
	}
	//------------------------------------------------------------
	//	Создание бэкендов для текущей платформы
	//------------------------------------------------------------
	std::unique_ptr<IServiceBackend> makeServiceBackend() {
		return platform::makeServiceBackend();
	}
	std::unique_ptr<IProcessControl> makeProcessControl() {
		return platform::makeProcessControl();
	}
	std::unique_ptr<ITaskScheduler> makeTaskScheduler() {
		return platform::makeTaskScheduler();
	}
	//------------------------------------------------------------
	//	Очистка каталога данных
	//------------------------------------------------------------
	bool clearDataDir(const std::filesystem::path& dir, std::string* error) {
		return platform::clearDirectory(dir, error);
	}
	//------------------------------------------------------------
	//	Владелец каталога данных
	//------------------------------------------------------------
	DirOwner dataDirOwner(const std::filesystem::path& dir) {
		return platform::readOwner(dir);
	}
	bool restoreDataDirOwner(const std::filesystem::path& dir, const DirOwner& owner, std::string* error) {
		return platform::applyOwner(dir, owner, error);
	}
	//------------------------------------------------------------
	//	Учётная запись планировщика
	//------------------------------------------------------------
	std::string scheduleAccount(const std::filesystem::path& dataDir) {
		return platform::scheduleAccount(dataDir);
	}
}; //---namespace jfbak
