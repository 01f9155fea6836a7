#pragma once
#include <filesystem>
#include <memory>
#include <string>

namespace jfbak {

	class IServiceBackend;
	class IProcessControl;
	class ITaskScheduler;

	//---Запущено с правами администратора / root
	bool requireAdminRoot();

	//---Создание бэкендов для текущей платформы
	std::unique_ptr<IServiceBackend> makeServiceBackend();
	std::unique_ptr<IProcessControl> makeProcessControl();
	std::unique_ptr<ITaskScheduler> makeTaskScheduler();

	//---Очистка каталога данных перед восстановлением.
	//	Отказывает для пустого пути и корня диска
	bool clearDataDir(const std::filesystem::path& dir, std::string* error);

	//---Владелец каталога (uid/gid). На Windows не определяется
	struct DirOwner final {
		bool known = false;
		unsigned int uid = 0;
		unsigned int gid = 0;
	};

	//---Владелец каталога данных до восстановления
	DirOwner dataDirOwner(const std::filesystem::path& dir);
	//---Вернуть владельца всему восстановленному дереву (распаковка идёт от root)
	bool restoreDataDirOwner(const std::filesystem::path& dir, const DirOwner& owner, std::string* error);

	//---Учётная запись для запланированного запуска.
	//	Пусто - учётная запись планировщика по умолчанию
	std::string scheduleAccount(const std::filesystem::path& dataDir);

};//---namespace jfbak
