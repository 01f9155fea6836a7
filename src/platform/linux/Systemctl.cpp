#if defined(__linux__)

#include "platform/linux/Systemctl.hpp"
#include "jellyfin_backup/Process.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>

namespace jfbak::platform::systemd {

    namespace {
        //---Путь к systemctl
        const fs::path kSystemctl = "/bin/systemctl";
    } // namespace

    //---Проверка корректности имени systemd unit
    bool isValidUnitName(const std::string& name)
    {
        if (name.empty()) return false;

        for (char c : name)
        {
            const bool ok =
                (c >= 'a' && c <= 'z') ||
                (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') ||
                c == '_' || c == '.' || c == '-';
            if (!ok) return false;
        }
        return true;
    }

    //---Запуск systemctl с проверкой кода возврата
    bool runSystemctl(const std::vector<std::string>& args,
        std::initializer_list<int> okExitCodes,
        std::string* error,
        const char* what)
    {
        process::RunResult rr;
        const bool ok = process::run(kSystemctl, args, rr, process::RunOptions{});
        if (!ok || !rr.started)
        {
            if (error)
            {
                std::ostringstream os;
                os << what << ": failed to start systemctl. sysError=" << rr.sysError;
                *error = os.str();
            }
            return false;
        }

        for (int code : okExitCodes)
        {
            if (rr.exitCode == code) return true;
        }

        if (error)
        {
            std::ostringstream os;
            os << what << ": systemctl exitCode=" << rr.exitCode;
            *error = os.str();
        }
        return false;
    }

    int systemctlExitCode(const std::vector<std::string>& args)
    {
        process::RunResult rr;
        if (!process::run(kSystemctl, args, rr, process::RunOptions{}) || !rr.started) return -1;
        return rr.exitCode;
    }

    //---Аргумент ExecStart. % удваивается (спецификатор systemd), обратная косая черта и кавычка экранируются
    std::string quoteIfNeeded(const std::string& s)
    {
        if (s.empty()) return "\"\"";

        bool need = false;
        std::string out;
        out.reserve(s.size() + 2);
        for (char c : s)
        {
            switch (c)
            {
            case '%': out += "%%"; break;
            case '\\': out += "\\\\"; need = true; break;
            case '"': out += "\\\""; need = true; break;
            case ' ': case '\t': out.push_back(c); need = true; break;
            default: out.push_back(c); break;
            }
        }
        if (!need) return out;
        return "\"" + out + "\"";
    }

    //---OnCalendar= для периодичности
    std::string onCalendarFor(Frequency f, int hour, int minute, const std::tm& now)
    {
        char hm[16];
        std::snprintf(hm, sizeof(hm), "%02d:%02d:00", hour, minute);

        switch (f)
        {
        case Frequency::Daily: return std::string("*-*-* ") + hm;
        case Frequency::Weekly: return std::string("Mon *-*-* ") + hm;
        case Frequency::Monthly: return std::string("*-*-01 ") + hm;
        case Frequency::Once: break;
        }

        //---Однократно: сегодня, если время ещё не прошло, иначе завтра
        std::tm base = now;
        base.tm_isdst = -1;
        const std::time_t nowT = std::mktime(&base);

        std::tm at = now;
        at.tm_hour = hour;
        at.tm_min = minute;
        at.tm_sec = 0;
        at.tm_isdst = -1;
        if (std::mktime(&at) <= nowT)
        {
            at.tm_mday += 1;
            at.tm_isdst = -1;
            (void)std::mktime(&at);
        }

        char date[32];
        std::snprintf(date, sizeof(date), "%04d-%02d-%02d ", at.tm_year + 1900, at.tm_mon + 1, at.tm_mday);
        return std::string(date) + hm;
    }

    std::string renderServiceUnit(const ScheduledTask& task)
    {
        std::string execStart = quoteIfNeeded(task.exe.string());
        for (const auto& a : task.args) execStart += " " + quoteIfNeeded(a);

        //---Без User= системный unit выполняется от root: это и есть максимальные права
        std::ostringstream os;
        os <<
            "[Unit]\n"
            "Description=Jellyfin backup (" << task.name << ")\n"
            "\n"
            "[Service]\n"
            "Type=oneshot\n";
        if (!task.user.empty()) os << "User=" << task.user << "\n";
        os << "ExecStart=" << execStart << "\n";
        return os.str();
    }

    std::string renderTimerUnit(const ScheduledTask& task, const std::tm& now)
    {
        std::ostringstream os;
        os <<
            "[Unit]\n"
            "Description=Jellyfin backup schedule (" << task.name << ")\n"
            "\n"
            "[Timer]\n"
            "OnCalendar=" << onCalendarFor(task.frequency, task.hour, task.minute, now) << "\n";
        //---Пропущенный периодический запуск выполняется после включения машины
        if (task.frequency != Frequency::Once) os << "Persistent=true\n";
        os <<
            "Unit=" << task.name << ".service\n"
            "\n"
            "[Install]\n"
            "WantedBy=timers.target\n";
        return os.str();
    }

    bool writeUnitFile(const fs::path& p, const std::string& content, std::string* error)
    {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);

        std::ofstream f(p, std::ios::binary | std::ios::trunc);
        if (!f)
        {
            if (error) *error = "Failed to open unit file for writing: " + p.string();
            return false;
        }

        f << content;
        f.flush();
        if (!f)
        {
            if (error) *error = "Failed to write unit file: " + p.string();
            return false;
        }
        return true;
    }

} // namespace jfbak::platform::systemd

#endif // __linux__
