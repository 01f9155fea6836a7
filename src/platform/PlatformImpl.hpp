#pragma once
#include <ctime>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "jellyfin_backup/Platform.hpp"

namespace jfbak {

	class IServiceBackend;
	class IProcessControl;
	class ITaskScheduler;
	struct ExtractStrategy;

	//---Платформенно-зависимые реализации
	namespace platform {
		namespace fs = std::filesystem;

		//---Получение пути к собственному исполняемому файлу
		fs::path selfExePath();
		//---Проверка, что процесс запущен с правами администратора / root
		bool isElevated();

		//---Системный каталог данных Jellyfin (установка как служба)
		fs::path systemDataDir();
		//---Корень пользовательских данных (%LOCALAPPDATA% / $XDG_DATA_HOME)
		fs::path userDataRoot();
		//---Исполняемый файл сервера при установке "для пользователя"
		fs::path defaultUserExe();

		std::string defaultServiceName();
		std::string defaultProcessName();

		//---Имена исполняемого файла 7-Zip, сначала самый функциональный
		std::vector<std::string> archiverExeNames();
		//---URL переносимого дистрибутива 7-Zip
		std::string defaultToolUrl();
		//---Способы распаковки дистрибутива утилитами, обычно имеющимися в системе
		std::vector<ExtractStrategy> extractStrategies();

		//---Удалить всё содержимое каталога (сам каталог остаётся)
		bool clearDirectory(const fs::path& dir, std::string* error);
		//---Владелец каталога (stat). На Windows known = false
		DirOwner readOwner(const fs::path& dir);
		//---Рекурсивно назначить владельца (lchown, ссылки не разыменовываются). На Windows ничего не делает
		bool applyOwner(const fs::path& dir, const DirOwner& owner, std::string* error);

		//---Пользователь, от имени которого выполнять задачу: владелец
		//	пользовательской установки, зарегистрировавший её (в т.ч. через sudo)
		std::string scheduleAccount(const fs::path& dataDir);

		//---Локальное время (localtime_r / localtime_s)
		bool toLocalTime(std::time_t t, std::tm& out);
		//---UTC (gmtime_r / gmtime_s)
		bool toUtcTime(std::time_t t, std::tm& out);

		//---Cоздание бэкендов для текущей платформы
		std::unique_ptr<IServiceBackend> makeServiceBackend();
		std::unique_ptr<IProcessControl> makeProcessControl();
		std::unique_ptr<ITaskScheduler> makeTaskScheduler();
	}

} // namespace jfbak
