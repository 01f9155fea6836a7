#pragma once
#include "Cli.hpp"

namespace jfbak {

	//---Запуск приложения с разобранными опциями. Возвращает код выхода процесса
	int runApp(const CliOptions& opt, const char* programName);

};//---namespace jfbak
