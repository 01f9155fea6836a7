#pragma once
#ifdef _WIN32

#include <filesystem>
#include <string>
#include <string_view>

namespace jfbak::platform::win {

    namespace fs = std::filesystem;

    //---Путь к утилите из системного каталога (C:\Windows\System32\<name>)
    fs::path system32Path(const wchar_t* name);

    //---UTF-8 → UTF-16 для Windows API
    std::wstring utf8ToWide(const std::string& s);

    //---UTF-16 → UTF-8
    std::string wideToUtf8(std::wstring_view w);

    //---fs::path → UTF-8
    std::string pathToUtf8(const fs::path& p);

    //---Известные папки (пусто при ошибке)
    fs::path programDataDir();      // C:\ProgramData
    fs::path localAppDataDir();     // %LOCALAPPDATA%

} // namespace jfbak::platform::win

#endif // _WIN32
