#ifdef _WIN32

#include "jellyfin_backup/IProcessControl.hpp"
#include "jellyfin_backup/Process.hpp"
#include "platform/PlatformImpl.hpp"
#include "platform/windows/WinUtil.hpp"

#include <windows.h>
#include <tlhelp32.h>

#include <memory>
#include <string>
#include <vector>

namespace jfbak {

    namespace {

        //---RAII для HANDLE
        struct HandleGuard final {
            HANDLE h = nullptr;
            explicit HandleGuard(HANDLE handle) : h(handle) {}
            ~HandleGuard() { if (h && h != INVALID_HANDLE_VALUE) CloseHandle(h); }
            HandleGuard(const HandleGuard&) = delete;
            HandleGuard& operator=(const HandleGuard&) = delete;
        };

        //---PID процессов с данным именем образа (без учёта регистра)
        static std::vector<DWORD> findByName(const std::string& name, DWORD* sysError)
        {
            std::vector<DWORD> pids;
            const std::wstring wanted = platform::win::utf8ToWide(name);
            const DWORD self = GetCurrentProcessId();

            HandleGuard snap(CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0));
            if (snap.h == INVALID_HANDLE_VALUE)
            {
                if (sysError) *sysError = GetLastError();
                return pids;
            }

            PROCESSENTRY32W pe{};
            pe.dwSize = sizeof(pe);
            for (BOOL ok = Process32FirstW(snap.h, &pe); ok; ok = Process32NextW(snap.h, &pe))
            {
                if (pe.th32ProcessID != self && _wcsicmp(pe.szExeFile, wanted.c_str()) == 0)
                    pids.push_back(pe.th32ProcessID);
            }
            return pids;
        }

    } // namespace

    class ProcessControlWin final : public IProcessControl {
    public:
        bool isRunning(const std::string& name) override
        {
            return !findByName(name, nullptr).empty();
        }

        bool killAll(const std::string& name, std::string* error) override
        {
            DWORD snapError = 0;
            const std::vector<DWORD> pids = findByName(name, &snapError);
            if (snapError != 0)
            {
                if (error) *error = "CreateToolhelp32Snapshot failed, error=" + std::to_string(snapError);
                return false;
            }

            bool ok = true;
            for (DWORD pid : pids)
            {
                HandleGuard proc(OpenProcess(PROCESS_TERMINATE | SYNCHRONIZE, FALSE, pid));
                if (!proc.h)
                {
                    //---Процесс мог уже завершиться
                    const DWORD e = GetLastError();
                    if (e == ERROR_INVALID_PARAMETER) continue;
                    ok = false;
                    if (error) *error = "OpenProcess(" + std::to_string(pid) + ") failed, error=" + std::to_string(e);
                    continue;
                }

                if (!TerminateProcess(proc.h, 1))
                {
                    ok = false;
                    if (error) *error = "TerminateProcess(" + std::to_string(pid) + ") failed, error=" + std::to_string(GetLastError());
                    continue;
                }
                (void)WaitForSingleObject(proc.h, 5000);
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
        return std::make_unique<jfbak::ProcessControlWin>();
    }

} // namespace jfbak::platform

#endif // _WIN32
