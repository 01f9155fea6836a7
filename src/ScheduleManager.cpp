#include "jellyfin_backup/ScheduleManager.hpp"
#include "jellyfin_backup/AppConfig.hpp"
#include "jellyfin_backup/Cli.hpp"

#include <sstream>
#include <glog/logging.h>

namespace jfbak {

	std::optional<Frequency> parseFrequency(std::string_view code) {
		if (code.size() != 1) return std::nullopt;

		switch (code.front())
		{
		case 'd': case 'D': return Frequency::Daily;
		case 'w': case 'W': return Frequency::Weekly;
		case 'm': case 'M': return Frequency::Monthly;
		case 'y': case 'Y': return Frequency::Once;		//	однократно, не ежегодно
		default: return std::nullopt;
		}
	}

	const char* toString(Frequency f) {
		switch (f)
		{
		case Frequency::Daily: return "DAILY";
		case Frequency::Weekly: return "WEEKLY";
		case Frequency::Monthly: return "MONTHLY";
		case Frequency::Once: return "ONCE";
		}
		return "UNKNOWN";
	}

	ScheduleManager::ScheduleManager(const AppConfig& cfg, ITaskScheduler& scheduler)
		: cfg_(cfg), scheduler_(scheduler)
	{
	}

	//------------------------------------------------------------
	//	Аргументы запланированного запуска: уже разрешённые пути и имена.
	//	Задача не зависит от окружения, в котором её выполнит планировщик
	//------------------------------------------------------------
	std::vector<std::string> ScheduleManager::taskArgs() const
	{
		std::vector<std::string> args = { kBackupOnlyFlag };

		auto add = [&args](const char* flag, const std::string& value) {
			if (!value.empty()) args.push_back(std::string(flag) + "=" + value);
		};
		add("--data-dir", cfg_.dataDir.string());
		add("--backup-dir", cfg_.backupDir.string());
		add("--tool-dir", cfg_.toolDir.string());
		add("--tool-url", cfg_.toolUrl);
		add("--service-name", cfg_.serviceName);
		if (cfg_.settleDelay.count() == 0) args.push_back("--no-delay");
		return args;
	}

	ScheduledTask ScheduleManager::taskFor(Frequency f) const
	{
		ScheduledTask t;
		t.name = cfg_.taskName;
		t.frequency = f;
		t.exe = cfg_.selfExe;
		t.args = taskArgs();
		t.hour = 3;
		t.minute = 0;
		t.highestPrivileges = true;
		t.user = cfg_.taskUser;
		return t;
	}

	//------------------------------------------------------------
	//	Удаление прежней задачи и регистрация новой
	//------------------------------------------------------------
	ScheduleResult ScheduleManager::schedule(std::string_view code)
	{
		ScheduleResult r;

		r.frequency = parseFrequency(code);
		if (!r.frequency)
		{
			r.status = ScheduleStatus::InvalidFrequency;
			r.error = "Invalid frequency '" + std::string(code) + "', expected d, w, m or y";
			LOG(WARNING) << r.error;
			return r;
		}

		std::string err;
		if (!scheduler_.remove(cfg_.taskName, &err))
		{
			//---Создание с заменой всё равно перезапишет задачу
			LOG(WARNING) << "Failed to remove existing task '" << cfg_.taskName << "': " << err;
			err.clear();
		}

		const ScheduledTask task = taskFor(*r.frequency);
		if (!scheduler_.create(task, &err))
		{
			r.status = ScheduleStatus::RegistrationFailed;
			r.error = err.empty() ? std::string("Task registration failed") : err;
			LOG(ERROR) << r.error;
			return r;
		}

		std::ostringstream cmd;
		cmd << task.exe.string();
		for (const auto& a : task.args) cmd << " " << a;
		LOG(INFO) << "Scheduled task '" << task.name << "' registered: " << toString(task.frequency)
			<< " at 03:00, " << cmd.str() << (task.user.empty() ? std::string() : ", user " + task.user);
		r.status = ScheduleStatus::Registered;
		return r;
	}

};//---namespace jfbak
