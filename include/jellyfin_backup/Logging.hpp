#pragma once
#include <filesystem>

namespace jfbak {

	//---Инициализация glog: файлы info/warning/error/fatal в logDir + вывод в консоль
	void initLogging(const char* programName, const std::filesystem::path& logDir);

};//---namespace jfbak
