#if defined(__linux__)

#include "jellyfin_backup/ITaskScheduler.hpp"
#include "platform/PlatformImpl.hpp"
#include "platform/linux/Systemctl.hpp"

#include <chrono>
#include <memory>
#include <system_error>

namespace jfbak {

    namespace {

        static fs::path serviceUnitPath(const std::string& name)
        {
            return platform::systemd::kUnitDir / (name + ".service");
        }

        static fs::path timerUnitPath(const std::string& name)
        {
            return platform::systemd::kUnitDir / (name + ".timer");
        }

    } // namespace

    //---Задача резервного копирования как пара systemd .service + .timer
    class SchedulerLinuxSystemd final : public ITaskScheduler {
    public:
        bool remove(const std::string& name, std::string* error) override
        {
            if (!platform::systemd::isValidUnitName(name))
            {
                if (error) *error = "remove: invalid task name (allowed: A-Za-z0-9_.-)";
                return false;
            }

            const fs::path timer = timerUnitPath(name);
            const fs::path service = serviceUnitPath(name);

            std::error_code ec;
            const bool hadTimer = fs::exists(timer, ec);
            const bool hadService = fs::exists(service, ec);

            //---Идемпотентность: нет файлов - нечего удалять
            if (!hadTimer && !hadService) return true;

            //---disable best-effort: timer мог быть уже выключен
            if (hadTimer)
            {
                std::string tmp;
                (void)platform::systemd::runSystemctl({ "disable", "--now", name + ".timer" }, { 0 }, &tmp, "systemctl disable");
            }

            for (const fs::path& p : { timer, service })
            {
                ec.clear();
                fs::remove(p, ec);
                if (ec)
                {
                    if (error) *error = "Failed to remove unit file: " + p.string() + " : " + ec.message();
                    return false;
                }
            }

            return platform::systemd::runSystemctl({ "daemon-reload" }, { 0 }, error, "systemctl daemon-reload");
        }

        bool create(const ScheduledTask& task, std::string* error) override
        {
            if (!platform::systemd::isValidUnitName(task.name))
            {
                if (error) *error = "create: invalid task name (allowed: A-Za-z0-9_.-)";
                return false;
            }
            if (task.exe.empty() || !task.exe.is_absolute())
            {
                if (error) *error = "create: task executable must be an absolute path";
                return false;
            }

            std::tm now{};
            const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            if (!platform::toLocalTime(t, now))
            {
                if (error) *error = "create: failed to read local time";
                return false;
            }

            //--- 1) unit-файлы
            if (!platform::systemd::writeUnitFile(serviceUnitPath(task.name), platform::systemd::renderServiceUnit(task), error))
                return false;
            if (!platform::systemd::writeUnitFile(timerUnitPath(task.name), platform::systemd::renderTimerUnit(task, now), error))
                return false;

            //--- 2) Перечитать конфигурацию systemd
            if (!platform::systemd::runSystemctl({ "daemon-reload" }, { 0 }, error, "systemctl daemon-reload"))
                return false;

            //--- 3) Включить и запустить timer
            return platform::systemd::runSystemctl({ "enable", "--now", task.name + ".timer" }, { 0 }, error, "systemctl enable");
        }
    };

} // namespace jfbak

namespace jfbak::platform {

    std::unique_ptr<ITaskScheduler> makeTaskScheduler()
    {
        return std::make_unique<jfbak::SchedulerLinuxSystemd>();
    }

} // namespace jfbak::platform

#endif // __linux__
