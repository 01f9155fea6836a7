#ifdef _WIN32

#include "jellyfin_backup/IServiceBackend.hpp"
#include "jellyfin_backup/Process.hpp"
#include "platform/PlatformImpl.hpp"
#include "platform/windows/WinUtil.hpp"

#include <windows.h>
#include <filesystem>
#include <memory>
#include <sstream>

namespace jfbak {

    namespace fs = std::filesystem;

	//--- Проверка, что код выхода входит в список допустимых
    static bool scOkExit(int code, std::initializer_list<int> ok)
    {
        for (int v : ok) if (code == v) return true;
        return false;
    }

    //---Обёртка над sc.exe
    static bool runSc(const std::vector<std::string>& args,
        std::initializer_list<int> okExitCodes,
        std::string* error,
        const char* what)
    {
        process::RunResult rr;
        const bool started = process::run(platform::win::system32Path(L"sc.exe"), args, rr, process::RunOptions{ .hideWindow = true });

        if (!started || !rr.started)
        {
            if (error)
            {
                std::ostringstream os;
                os << what << ": failed to start sc.exe. sysError=" << rr.sysError;
                *error = os.str();
            }
            return false;
        }

        if (!scOkExit(rr.exitCode, okExitCodes))
        {
            if (error)
            {
                std::ostringstream os;
                os << what << ": sc.exe exitCode=" << rr.exitCode;
                *error = os.str();
            }
            return false;
        }

        return true;
    }

	//---Управление службой Jellyfin через sc.exe
    class BackendWinSc final : public IServiceBackend {
    public:
        //---sc query: 0 - есть, 1060 - службы нет
        bool exists(const std::string& name, bool& exists, std::string* error) override
        {
            if (name.empty()) { if (error) *error = "exists: empty service name"; return false; }

            process::RunResult rr;
            const bool started = process::run(platform::win::system32Path(L"sc.exe"), { "query", name }, rr, process::RunOptions{ .hideWindow = true });
            if (!started || !rr.started)
            {
                if (error)
                {
                    std::ostringstream os;
                    os << "sc query: failed to start sc.exe. sysError=" << rr.sysError;
                    *error = os.str();
                }
                return false;
            }

            if (rr.exitCode == 0) { exists = true; return true; }
            if (rr.exitCode == (int)ERROR_SERVICE_DOES_NOT_EXIST) { exists = false; return true; }

            if (error)
            {
                std::ostringstream os;
                os << "sc query: unexpected exitCode=" << rr.exitCode;
                *error = os.str();
            }
            return false;
        }

        bool start(const std::string& name, std::string* error) override
        {
            // 1056 = уже запущена
            return runSc({ "start", name }, { 0, (int)ERROR_SERVICE_ALREADY_RUNNING }, error, "sc start");
        }

        //---sc stop не ждёт остановки: ожидание в ServiceController
        bool stop(const std::string& name, std::string* error) override
        {
            // 1062 = уже остановлена
            return runSc({ "stop", name }, { 0, (int)ERROR_SERVICE_NOT_ACTIVE }, error, "sc stop");
        }
    };

} // namespace jfbak

namespace jfbak::platform {

    std::unique_ptr<IServiceBackend> makeServiceBackend()
    {
        return std::make_unique<jfbak::BackendWinSc>();
    }

} // namespace jfbak::platform

#endif
