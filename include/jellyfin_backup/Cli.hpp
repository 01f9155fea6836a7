#pragma once
#include <string>
#include <iostream>

namespace jfbak {

	//---Режим работы
	enum class Command {
	Menu,			//	Интерактивное меню (по умолчанию)
	BackupOnly,		//	Одно резервное копирование без диалога (для планировщика)
	Help,
	Invalid
	};

	//---Опции командной строки
	struct CliOptions final {

		Command cmd = Command::Menu;

		//---Переопределения путей (пусто - значения по умолчанию)
		std::string dataDir;		//	Каталог данных Jellyfin (проверяется первым)
		std::string backupDir;		//	Папка для архивов по умолчанию
		std::string toolDir;		//	Папка с архиватором
		std::string toolUrl;		//	URL переносимого 7-Zip
		std::string serviceName;	//	Имя службы Jellyfin

		//---Без паузы после остановки сервера
		bool noDelay = false;
	};

	//---Флаг режима без диалога: его же ставит задача планировщика
	inline constexpr const char* kBackupOnlyFlag = "--backup-only";

	CliOptions parseCli(int argc, char** argv);
	void printHelp(std::ostream& os);

};//---namespace jfbak
