#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "Cli.hpp"

namespace jfbak {

	namespace fs = std::filesystem;

	//---Конфигурация, собранная один раз при старте и передаваемая компонентам по ссылке
	struct AppConfig final {

		//---Каталог данных Jellyfin
		std::vector<fs::path> dataDirCandidates;	//	В порядке приоритета
		fs::path dataDir;							//	Выбранный кандидат (resolveDataDir)

		//---Сама программа
		fs::path selfExe;
		fs::path logDir;

		//---Архиватор
		fs::path toolDir;
		std::string toolUrl;
		std::vector<std::string> toolExeNames;		//	Сначала самый функциональный

		//---Резервные копии
		fs::path backupDir;							//	Папка по умолчанию

		//---Сервер Jellyfin
		std::string serviceName;
		std::string processName;
		fs::path userExe;							//	Установка "для пользователя" без службы
		std::chrono::milliseconds stopTimeout{ 30000 };
		std::chrono::milliseconds settleDelay{ 3000 };

		//---Планировщик
		std::string taskName = "JellyfinBackup";
		std::string taskUser;						//	Владелец пользовательской установки (scheduleAccount)
	};

	//---Значения по умолчанию для текущей платформы + переопределения из командной строки
	AppConfig makeConfig(const CliOptions& opt);

};//---namespace jfbak
