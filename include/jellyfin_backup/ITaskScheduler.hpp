#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace jfbak {

	namespace fs = std::filesystem;

	//---Периодичность запуска
	enum class Frequency {
		Daily,
		Weekly,
		Monthly,
		Once
	};

	//---Описание задачи планировщика
	struct ScheduledTask final {
		std::string name;					//	Имя задачи (одна задача на установку)
		Frequency frequency = Frequency::Daily;
		fs::path exe;						//	Абсолютный путь к программе
		std::vector<std::string> args;		//	Аргументы (режим резервного копирования без диалога)
		int hour = 3;						//	Время запуска (локальное)
		int minute = 0;
		bool highestPrivileges = true;		//	Запуск с максимальными правами пользователя
		std::string user;					//	Учётная запись запуска. Пусто - по умолчанию планировщика
	};

	//---Интерфейс планировщика ОС (Task Scheduler / systemd timers)
	class ITaskScheduler {
	public:
		virtual ~ITaskScheduler() = default;

		//---Удаление задачи. Отсутствие задачи - не ошибка
		virtual bool remove(const std::string& name, std::string* error) = 0;
		virtual bool create(const ScheduledTask& task, std::string* error) = 0;
	};
};//---namespace jfbak
