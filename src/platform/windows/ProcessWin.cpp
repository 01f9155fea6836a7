#ifdef _WIN32

#include "platform/ProcessImpl.hpp"
#include "platform/windows/WinUtil.hpp"
#include <windows.h>
#include <string_view>
#include <vector>
#include <glog/logging.h>

namespace jfbak::process::detail {

    namespace {

        //---Quoting аргумента под CreateProcess (правило backslashes + quotes)
        static std::wstring quoteWindowsArg(std::wstring_view arg)
        {
            const bool needQuotes =
                arg.empty() || (arg.find_first_of(L" \t\n\v\"") != std::wstring_view::npos);
            if (!needQuotes) return std::wstring(arg);

            std::wstring out;
            out.reserve(arg.size() + 2);
            out.push_back(L'"');

            std::size_t bsCount = 0;
            for (wchar_t ch : arg)
            {
                if (ch == L'\\')
                {
                    ++bsCount;
                    out.push_back(L'\\');
                    continue;
                }
                if (ch == L'"')
                {
                    //---удвоить backslash'и перед кавычкой и экранировать кавычку
                    out.append(bsCount, L'\\');
                    bsCount = 0;
                    out.push_back(L'\\');
                    out.push_back(L'"');
                    continue;
                }
                bsCount = 0;
                out.push_back(ch);
            }

            out.append(bsCount, L'\\');
            out.push_back(L'"');
            return out;
        }

        //---Командная строка для CreateProcess в изменяемом буфере
        static std::vector<wchar_t> buildCommandLine(const fs::path& exe, const std::vector<std::string>& args)
        {
            std::wstring cmd = quoteWindowsArg(exe.wstring());
            for (const auto& a : args)
            {
                cmd.push_back(L' ');
                cmd += quoteWindowsArg(platform::win::utf8ToWide(a));
            }
            std::vector<wchar_t> buf(cmd.begin(), cmd.end());
            buf.push_back(L'\0');
            return buf;
        }

    } // namespace

	//---Платформенно-специфичная реализация запуска процесса для Windows
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args, RunResult& out, const RunOptions& opt)
    {
        out = {};

        std::vector<wchar_t> cmdLine = buildCommandLine(exe, args);

        STARTUPINFOW si{};
        si.cb = sizeof(si);
        PROCESS_INFORMATION pi{};

        const DWORD flags = opt.hideWindow ? CREATE_NO_WINDOW : 0;
        const std::wstring cwdW = opt.workingDir.empty() ? L"" : opt.workingDir.wstring();
        const wchar_t* cwdPtr = opt.workingDir.empty() ? nullptr : cwdW.c_str();

        BOOL ok = CreateProcessW(
            exe.wstring().c_str(), // Имя исполняемого файла
            cmdLine.data(),        // Командная строка (mutable)
            nullptr, nullptr,      // Атрибуты безопасности
            FALSE,                 // Без наследования дескрипторов
            flags,
            nullptr,               // Окружение родителя
            cwdPtr,                // nullptr = текущая директория
            &si,
            &pi
        );

        if (!ok)
        {
            out.started = false;
            out.sysError = GetLastError();
            out.exitCode = (int)out.sysError;
            LOG(ERROR) << "Failed to create process " << exe << " with error: " << out.sysError;
            return false;
        }

        out.started = true;
        CloseHandle(pi.hThread);

        const DWORD timeout = (opt.timeoutMs == 0) ? INFINITE : opt.timeoutMs;
        const DWORD waitRes = WaitForSingleObject(pi.hProcess, timeout);
        if (waitRes == WAIT_TIMEOUT)
        {
            out.timedOut = true;
            TerminateProcess(pi.hProcess, 1);
            WaitForSingleObject(pi.hProcess, 5000);
        }
        else if (waitRes == WAIT_FAILED)
        {
            out.sysError = GetLastError();
            CloseHandle(pi.hProcess);
            out.exitCode = (int)out.sysError;
            LOG(ERROR) << "WaitForSingleObject failed for process " << exe << " with error " << out.sysError;
            return false;
        }

        DWORD code = 0;
        if (!GetExitCodeProcess(pi.hProcess, &code))
        {
            out.sysError = GetLastError();
            CloseHandle(pi.hProcess);
            out.exitCode = (int)out.sysError;
            LOG(ERROR) << "Failed to get exit code for process " << exe << " with error " << out.sysError;
            return false;
        }

        CloseHandle(pi.hProcess);
        out.exitCode = (int)code;
        return true;
    }

    //---Отсоединённый запуск: без консоли родителя, без ожидания
    bool spawnDetachedPlatform(const fs::path& exe, const std::vector<std::string>& args,
        std::string* error)
    {
        std::vector<wchar_t> cmdLine = buildCommandLine(exe, args);

        STARTUPINFOW si{};
        si.cb = sizeof(si);
        PROCESS_INFORMATION pi{};

        const std::wstring cwd = exe.parent_path().wstring();

        BOOL ok = CreateProcessW(
            exe.wstring().c_str(),
            cmdLine.data(),
            nullptr, nullptr,
            FALSE,
            DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP,
            nullptr,
            cwd.empty() ? nullptr : cwd.c_str(),
            &si,
            &pi
        );

        if (!ok)
        {
            if (error) *error = "CreateProcessW failed for " + exe.string() + ", error=" + std::to_string((int)GetLastError());
            return false;
        }

        CloseHandle(pi.hThread);
        CloseHandle(pi.hProcess);
        return true;
    }

} // namespace jfbak::process::detail
#endif
