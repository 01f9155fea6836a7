#include "jellyfin_backup/Menu.hpp"
#include "jellyfin_backup/BackupExecutor.hpp"
#include "jellyfin_backup/RestoreExecutor.hpp"
#include "jellyfin_backup/ScheduleManager.hpp"

#include <optional>
#include <string>

namespace jfbak {

	namespace {

		//---Строка без пробелов по краям
		static std::string trim(const std::string& s) {
			const auto b = s.find_first_not_of(" \t\r\n");
			if (b == std::string::npos) return {};
			const auto e = s.find_last_not_of(" \t\r\n");
			return s.substr(b, e - b + 1);
		}

		//---Путь, вставленный из проводника, часто приходит в кавычках
		static std::string unquote(std::string s) {
			if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')))
				s = s.substr(1, s.size() - 2);
			return s;
		}

		static std::optional<std::string> ask(std::istream& in, std::ostream& out, const char* prompt) {
			out << prompt << std::flush;
			std::string line;
			if (!std::getline(in, line)) return std::nullopt;
			return trim(line);
		}

		static void printOutcome(std::ostream& out, StopOutcome stop, StartOutcome start) {
			out << "Jellyfin: stop " << toString(stop) << ", start " << toString(start) << "\n";
		}

		//------------------------------------------------------------
		//	1. Резервная копия
		//------------------------------------------------------------
		static bool doBackup(std::istream& in, std::ostream& out, BackupExecutor& backup) {

			const auto where = ask(in, out, "Backup folder: [1] default, [2] custom: ");
			if (!where) return false;

			DestinationChoice choice = DestinationChoice::defaultFolder();
			if (*where == "2")
			{
				const auto path = ask(in, out, "Folder path (empty to cancel): ");
				if (!path) return false;
				choice = DestinationChoice::customFolder(unquote(*path));
			}
			else if (*where != "1" && !where->empty())
			{
				out << "Unknown choice\n";
				return true;
			}

			const BackupResult r = backup.run(choice);
			if (r.ok())
				out << "Backup created: " << r.archive.string() << "\n";
			else if (r.status == BackupStatus::NoDestination)
				out << "Backup cancelled\n";
			else
				out << "Backup failed (" << toString(r.status) << "): " << r.error << "\n";

			printOutcome(out, r.stop, r.start);
			return true;
		}

		//------------------------------------------------------------
		//	2. Восстановление (каталог данных будет очищен)
		//------------------------------------------------------------
		static bool doRestore(std::istream& in, std::ostream& out, RestoreExecutor& restore) {

			const auto path = ask(in, out, "Backup archive path (empty to cancel): ");
			if (!path) return false;

			std::optional<fs::path> archive;
			if (!path->empty())
			{
				out << "All current Jellyfin data will be deleted. Type 'yes' to continue: " << std::flush;
				std::string confirm;
				if (!std::getline(in, confirm)) return false;
				if (trim(confirm) == "yes") archive = fs::path(unquote(*path));
			}

			const RestoreResult r = restore.run(archive);
			if (r.ok())
				out << "Restore completed\n";
			else if (r.status == RestoreStatus::Cancelled)
				out << "Restore cancelled\n";
			else
				out << "Restore failed (" << toString(r.status) << "): " << r.error << "\n";

			if (r.serviceTouched) printOutcome(out, r.stop, r.start);
			return true;
		}

		//------------------------------------------------------------
		//	3. Расписание
		//------------------------------------------------------------
		static bool doSchedule(std::istream& in, std::ostream& out, ScheduleManager& schedule) {

			const auto code = ask(in, out, "Frequency: [d]aily, [w]eekly, [m]onthly, [y] once: ");
			if (!code) return false;

			const ScheduleResult r = schedule.schedule(*code);
			if (r.ok())
				out << "Scheduled backup: " << toString(*r.frequency) << " at 03:00\n";
			else
				out << "Schedule not changed: " << r.error << "\n";
			return true;
		}

	} // namespace

	//------------------------------------------------------------
	//	Главный цикл меню
	//------------------------------------------------------------
	void runMenu(std::istream& in, std::ostream& out,
		BackupExecutor& backup, RestoreExecutor& restore, ScheduleManager& schedule) {

		for (;;)
		{
			out << "\n"
				"Jellyfin backup\n"
				"  1. Back up\n"
				"  2. Restore\n"
				"  3. Schedule backups\n"
				"  4. Exit\n";

			const auto choice = ask(in, out, "> ");
			if (!choice || *choice == "4") return;

			bool more = true;
			if (*choice == "1") more = doBackup(in, out, backup);
			else if (*choice == "2") more = doRestore(in, out, restore);
			else if (*choice == "3") more = doSchedule(in, out, schedule);
			else out << "Unknown choice\n";

			if (!more) return;
		}
	}

};//---namespace jfbak
