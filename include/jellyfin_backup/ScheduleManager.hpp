#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "ITaskScheduler.hpp"

namespace jfbak {

	struct AppConfig;

	//---d → Daily, w → Weekly, m → Monthly, y → Once (регистр не важен).
	//	Любая другая строка → nullopt
	std::optional<Frequency> parseFrequency(std::string_view code);

	//---DAILY / WEEKLY / MONTHLY / ONCE
	const char* toString(Frequency f);

	enum class ScheduleStatus {
		Registered,
		InvalidFrequency,		//	Регистрация не менялась
		RegistrationFailed
	};

	struct ScheduleResult final {
		ScheduleStatus status = ScheduleStatus::Registered;
		std::optional<Frequency> frequency;
		std::string error;

		bool ok() const { return status == ScheduleStatus::Registered; }
	};

	//---Одна задача планировщика на установку: повторная регистрация заменяет прежнюю
	class ScheduleManager final {
	public:
		ScheduleManager(const AppConfig& cfg, ITaskScheduler& scheduler);

		ScheduleResult schedule(std::string_view code);

		//---Задача для заданной периодичности (03:00, --backup-only + разрешённая конфигурация)
		ScheduledTask taskFor(Frequency f) const;

	private:
		std::vector<std::string> taskArgs() const;

		const AppConfig& cfg_;
		ITaskScheduler& scheduler_;
	};

};//---namespace jfbak
