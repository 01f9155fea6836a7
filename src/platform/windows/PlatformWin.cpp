#ifdef _WIN32
#include "platform/PlatformImpl.hpp"
#include "platform/windows/WinUtil.hpp"
#include "jellyfin_backup/ArchiveToolProvisioner.hpp"

#include <windows.h>
#include <time.h>
#include <vector>

namespace jfbak::platform {

	//---Получение пути к собственному исполняемому файлу
    fs::path selfExePath()
    {
        wchar_t buf[MAX_PATH]{};
        DWORD n = GetModuleFileNameW(nullptr, buf, MAX_PATH);
        if (n == 0 || n >= MAX_PATH) return {};
        return fs::path(buf);
    }

	//---Проверка, что процесс запущен с правами администратора
    bool isElevated()
    {
        BOOL isAdmin = FALSE;
        PSID adminGroup = NULL;
        SID_IDENTIFIER_AUTHORITY NtAuthority = SECURITY_NT_AUTHORITY;

        if (AllocateAndInitializeSid(
            &NtAuthority, 2,
            SECURITY_BUILTIN_DOMAIN_RID,
            DOMAIN_ALIAS_RID_ADMINS,
            0, 0, 0, 0, 0, 0,
            &adminGroup))
        {
            CheckTokenMembership(NULL, adminGroup, &isAdmin);
            FreeSid(adminGroup);
        }
        return isAdmin == TRUE;
    }

    //---Установка как служба: C:\ProgramData\Jellyfin\Server
    fs::path systemDataDir()
    {
        const fs::path base = win::programDataDir();
        return base.empty() ? fs::path{} : base / L"Jellyfin" / L"Server";
    }

    fs::path userDataRoot()
    {
        return win::localAppDataDir();
    }

    //---Установка "для текущего пользователя"
    fs::path defaultUserExe()
    {
        const fs::path base = win::localAppDataDir();
        return base.empty() ? fs::path{} : base / L"Programs" / L"Jellyfin" / L"Server" / L"jellyfin.exe";
    }

    std::string defaultServiceName() { return "JellyfinServer"; }
    std::string defaultProcessName() { return "jellyfin.exe"; }

    //---7z.exe - полный 7-Zip, 7za.exe - автономная версия из переносимого архива
    std::vector<std::string> archiverExeNames() { return { "7z.exe", "7za.exe" }; }

    std::string defaultToolUrl() { return "https://www.7-zip.org/a/7za920.zip"; }

    //---tar.exe (bsdtar, Windows 10+), затем PowerShell Expand-Archive
    std::vector<ExtractStrategy> extractStrategies()
    {
        auto tarArgs = [](const fs::path& archive, const fs::path& outDir) {
            return std::vector<std::string>{ "-xf", win::pathToUtf8(archive), "-C", win::pathToUtf8(outDir) };
        };
        auto expandArgs = [](const fs::path& archive, const fs::path& outDir) {
            return std::vector<std::string>{
                "-NoProfile", "-NonInteractive", "-ExecutionPolicy", "Bypass", "-Command",
                "Expand-Archive -LiteralPath '" + win::pathToUtf8(archive) +
                "' -DestinationPath '" + win::pathToUtf8(outDir) + "' -Force"
            };
        };
        return {
            { "tar", win::system32Path(L"tar.exe"), tarArgs },
            { "Expand-Archive", win::system32Path(L"WindowsPowerShell\\v1.0\\powershell.exe"), expandArgs },
        };
    }

    bool toLocalTime(std::time_t t, std::tm& out)
    {
        return ::localtime_s(&out, &t) == 0;
    }

    bool toUtcTime(std::time_t t, std::tm& out)
    {
        return ::gmtime_s(&out, &t) == 0;
    }

    //---schtasks /Create регистрирует задачу под текущей учётной записью
    std::string scheduleAccount(const fs::path&)
    {
        return {};
    }

} // namespace jfbak::platform
#endif
