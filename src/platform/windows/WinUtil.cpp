#ifdef _WIN32

#include "platform/windows/WinUtil.hpp"

#include <windows.h>
#include <shlobj.h>
#include <glog/logging.h>

namespace jfbak::platform::win {

    fs::path system32Path(const wchar_t* name)
    {
        wchar_t sysDir[MAX_PATH]{};
        UINT n = GetSystemDirectoryW(sysDir, MAX_PATH);
        //---Если не удалось, вернём просто имя (поиск в PATH)
        if (n == 0 || n >= MAX_PATH) return fs::path(name);
        return fs::path(sysDir) / name;
    }

    std::wstring utf8ToWide(const std::string& s)
    {
        if (s.empty()) return {};

        const int n = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.c_str(), (int)s.size(), nullptr, 0);
        if (n <= 0)
        {
            LOG(ERROR) << "UTF-8 to wide conversion failed for: " << s;
            return {};
        }
        std::wstring w((size_t)n, L'\0');
        MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.c_str(), (int)s.size(), w.data(), n);
        return w;
    }

    std::string wideToUtf8(std::wstring_view w)
    {
        if (w.empty()) return {};

        int n = WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(),
            nullptr, 0, nullptr, nullptr);
        if (n <= 0) return {};

        std::string s((size_t)n, '\0');
        WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(),
            s.data(), n, nullptr, nullptr);
        return s;
    }

    std::string pathToUtf8(const fs::path& p)
    {
        return wideToUtf8(p.wstring());
    }

    //---Путь известной папки через SHGetKnownFolderPath
    static fs::path knownFolder(REFKNOWNFOLDERID id)
    {
        PWSTR wpath = nullptr;
        HRESULT hr = SHGetKnownFolderPath(id, 0, nullptr, &wpath);
        if (FAILED(hr) || !wpath)
        {
            if (wpath) CoTaskMemFree(wpath);
            return {};
        }
        fs::path p(wpath);
        CoTaskMemFree(wpath);
        return p;
    }

    fs::path programDataDir()
    {
        return knownFolder(FOLDERID_ProgramData);
    }

    fs::path localAppDataDir()
    {
        return knownFolder(FOLDERID_LocalAppData);
    }

} // namespace jfbak::platform::win

#endif // _WIN32
