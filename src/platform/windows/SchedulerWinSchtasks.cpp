#ifdef _WIN32

#include "jellyfin_backup/ITaskScheduler.hpp"
#include "jellyfin_backup/Process.hpp"
#include "platform/PlatformImpl.hpp"
#include "platform/windows/WinUtil.hpp"

#include <cstdio>
#include <memory>
#include <sstream>

namespace jfbak {

    namespace {

        //---Значение /SC
        static const char* scheduleType(Frequency f)
        {
            switch (f)
            {
            case Frequency::Daily: return "DAILY";
            case Frequency::Weekly: return "WEEKLY";
            case Frequency::Monthly: return "MONTHLY";
            case Frequency::Once: return "ONCE";
            }
            return "DAILY";
        }

        //---Обёртка над schtasks.exe
        static bool runSchtasks(const std::vector<std::string>& args, process::RunResult& rr,
            std::string* error, const char* what)
        {
            const bool started = process::run(platform::win::system32Path(L"schtasks.exe"), args, rr, process::RunOptions{ .hideWindow = true });
            if (!started || !rr.started)
            {
                if (error)
                {
                    std::ostringstream os;
                    os << what << ": failed to start schtasks.exe. sysError=" << rr.sysError;
                    *error = os.str();
                }
                return false;
            }
            return true;
        }

    } // namespace

    //---Задача резервного копирования в Планировщике заданий Windows
    class SchedulerWinSchtasks final : public ITaskScheduler {
    public:
        bool remove(const std::string& name, std::string* error) override
        {
            if (name.empty()) { if (error) *error = "remove: empty task name"; return false; }

            //---Нет задачи - нечего удалять
            process::RunResult rr;
            if (!runSchtasks({ "/Query", "/TN", name }, rr, error, "schtasks /Query")) return false;
            if (rr.exitCode != 0) return true;

            rr = {};
            if (!runSchtasks({ "/Delete", "/TN", name, "/F" }, rr, error, "schtasks /Delete")) return false;
            if (rr.exitCode != 0)
            {
                if (error) *error = "schtasks /Delete: exitCode=" + std::to_string(rr.exitCode);
                return false;
            }
            return true;
        }

        bool create(const ScheduledTask& task, std::string* error) override
        {
            if (task.name.empty()) { if (error) *error = "create: empty task name"; return false; }
            if (task.exe.empty() || !task.exe.is_absolute())
            {
                if (error) *error = "create: task executable must be an absolute path";
                return false;
            }

            //---/TR: "C:\path\jellyfin-backup.exe" --backup-only "--backup-dir=D:\My Backups"
            std::string tr = "\"" + platform::win::pathToUtf8(task.exe) + "\"";
            for (const auto& a : task.args)
                tr += (a.find(' ') != std::string::npos) ? " \"" + a + "\"" : " " + a;

            char st[8];
            std::snprintf(st, sizeof(st), "%02d:%02d", task.hour, task.minute);

            std::vector<std::string> args = {
                "/Create", "/TN", task.name,
                "/TR", tr,
                "/SC", scheduleType(task.frequency),
                "/ST", st,
            };
            if (task.highestPrivileges)
            {
                args.push_back("/RL");
                args.push_back("HIGHEST");
            }
            //---Перезаписать существующую
            args.push_back("/F");

            process::RunResult rr;
            if (!runSchtasks(args, rr, error, "schtasks /Create")) return false;
            if (rr.exitCode != 0)
            {
                if (error) *error = "schtasks /Create: exitCode=" + std::to_string(rr.exitCode);
                return false;
            }
            return true;
        }
    };

} // namespace jfbak

namespace jfbak::platform {

    std::unique_ptr<ITaskScheduler> makeTaskScheduler()
    {
        return std::make_unique<jfbak::SchedulerWinSchtasks>();
    }

} // namespace jfbak::platform

#endif // _WIN32
