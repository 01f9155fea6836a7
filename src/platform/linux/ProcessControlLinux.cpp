#if defined(__linux__)

#include "jellyfin_backup/IProcessControl.hpp"
#include "jellyfin_backup/Process.hpp"
#include "platform/PlatformImpl.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace jfbak {

    namespace {

        static std::string toLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return s;
        }

        //---PID процессов, у которых /proc/<pid>/comm совпадает с name (без учёта регистра).
        //  comm обрезается ядром до 15 символов
        static std::vector<pid_t> findByName(const std::string& name)
        {
            std::vector<pid_t> pids;
            const std::string wanted = toLower(name.substr(0, 15));
            const pid_t self = ::getpid();

            std::error_code ec;
            fs::directory_iterator it("/proc", ec);
            fs::directory_iterator end;
            for (; !ec && it != end; it.increment(ec))
            {
                const std::string dir = it->path().filename().string();
                if (dir.empty() || !std::all_of(dir.begin(), dir.end(), ::isdigit)) continue;

                std::ifstream comm(it->path() / "comm");
                std::string comm_name;
                if (!comm.is_open() || !std::getline(comm, comm_name)) continue;

                if (toLower(comm_name) == wanted)
                {
                    const pid_t pid = static_cast<pid_t>(std::strtol(dir.c_str(), nullptr, 10));
                    if (pid != self) pids.push_back(pid);
                }
            }
            return pids;
        }

    } // namespace

    class ProcessControlLinux final : public IProcessControl {
    public:
        bool isRunning(const std::string& name) override
        {
            return !findByName(name).empty();
        }

        bool killAll(const std::string& name, std::string* error) override
        {
            bool ok = true;
            for (pid_t pid : findByName(name))
            {
                //---ESRCH: процесс уже завершился
                if (::kill(pid, SIGKILL) != 0 && errno != ESRCH)
                {
                    ok = false;
                    if (error) *error = "kill(" + std::to_string(pid) + ") failed: " + std::strerror(errno);
                }
            }
            return ok;
        }

        bool launchDetached(const fs::path& exe, std::string* error) override
        {
            return process::spawnDetached(exe, {}, error);
        }
    };

} // namespace jfbak

namespace jfbak::platform {

    std::unique_ptr<IProcessControl> makeProcessControl()
    {
        return std::make_unique<jfbak::ProcessControlLinux>();
    }

} // namespace jfbak::platform

#endif // __linux__
