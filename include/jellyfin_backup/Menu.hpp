#pragma once
#include <iostream>

namespace jfbak {

	class BackupExecutor;
	class RestoreExecutor;
	class ScheduleManager;

	//---Консольное меню: 1 - резервная копия, 2 - восстановление, 3 - расписание, 4 - выход.
	//	Возвращается при выборе 4 или конце ввода
	void runMenu(std::istream& in, std::ostream& out,
		BackupExecutor& backup, RestoreExecutor& restore, ScheduleManager& schedule);

};//---namespace jfbak
