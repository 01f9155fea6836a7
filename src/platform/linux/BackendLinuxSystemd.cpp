#if defined(__linux__)

#include "jellyfin_backup/IServiceBackend.hpp"
#include "platform/PlatformImpl.hpp"
#include "platform/linux/Systemctl.hpp"

#include <memory>
#include <sstream>
#include <string>

namespace jfbak {

    namespace {

        //---Полное имя unit с расширением .service
        static std::string unitName(const std::string& name)
        {
            return name + ".service";
        }

        static bool checkName(const std::string& name, const char* what, std::string* error)
        {
            if (platform::systemd::isValidUnitName(name)) return true;
            if (error) *error = std::string(what) + ": invalid service name (allowed: A-Za-z0-9_.-)";
            return false;
        }

    } // namespace

    //---Управление службой Jellyfin через systemd
    class BackendLinuxSystemd final : public IServiceBackend {
    public:
        //---Unit известен systemd (в любом каталоге unit-файлов пакета)
        bool exists(const std::string& name, bool& exists, std::string* error) override
        {
            if (!checkName(name, "exists", error)) return false;

            // list-unit-files: 0 - найден, 1 - нет такого unit
            const int code = platform::systemd::systemctlExitCode({ "list-unit-files", "--no-legend", unitName(name) });
            if (code == 0) { exists = true; return true; }
            if (code == 1) { exists = false; return true; }

            if (error)
            {
                std::ostringstream os;
                os << "systemctl list-unit-files: unexpected exitCode=" << code;
                *error = os.str();
            }
            return false;
        }

        bool start(const std::string& name, std::string* error) override
        {
            if (!checkName(name, "start", error)) return false;
            return platform::systemd::runSystemctl({ "start", unitName(name) }, { 0 }, error, "systemctl start");
        }

        //---systemctl stop ждёт завершения unit; для неактивного unit тоже 0
        bool stop(const std::string& name, std::string* error) override
        {
            if (!checkName(name, "stop", error)) return false;
            return platform::systemd::runSystemctl({ "stop", unitName(name) }, { 0 }, error, "systemctl stop");
        }
    };

} // namespace jfbak

namespace jfbak::platform {

    std::unique_ptr<IServiceBackend> makeServiceBackend()
    {
        return std::make_unique<jfbak::BackendLinuxSystemd>();
    }

} // namespace jfbak::platform

#endif // __linux__
