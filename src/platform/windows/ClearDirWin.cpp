#ifdef _WIN32

#include "platform/PlatformImpl.hpp"
#include <windows.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include <glog/logging.h>

namespace jfbak::platform {

    namespace fs = std::filesystem;

    //------------------------------------------------------------
    //  Не даём очистить корень диска (C:\) и пустой путь
    //------------------------------------------------------------
    static bool isDangerousPath(const fs::path& p)
    {
        if (p.empty()) return true;

        std::error_code ec;
        fs::path abs = fs::absolute(p, ec);
        if (ec) abs = p;

        const fs::path root = abs.root_path();
        if (!root.empty() && abs == root) return true;

        //---"C:\", "C:" и т.п.
        if (abs.wstring().size() <= 3) return true;

        return false;
    }

    //------------------------------------------------------------
    //  Снять ReadOnly/Hidden/System: иначе remove_all падает
    //------------------------------------------------------------
    static void makeNormalAttributes(const fs::path& p)
    {
        const std::wstring w = p.wstring();
        DWORD attr = GetFileAttributesW(w.c_str());
        if (attr == INVALID_FILE_ATTRIBUTES) return;

        DWORD newAttr = attr & ~(FILE_ATTRIBUTE_READONLY | FILE_ATTRIBUTE_HIDDEN | FILE_ATTRIBUTE_SYSTEM);
        if (newAttr != attr)
        {
            (void)SetFileAttributesW(w.c_str(), newAttr);
        }
    }

    static void clearAttributesRecursive(const fs::path& root)
    {
        std::error_code ec;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        fs::recursive_directory_iterator end;
        while (!ec && it != end)
        {
            makeNormalAttributes(it->path());
            it.increment(ec);
        }
    }

    //------------------------------------------------------------
    //  Удалить содержимое каталога данных, сам каталог остаётся
    //  (на нём могут быть ACL, выданные установщиком)
    //------------------------------------------------------------
    bool clearDirectory(const fs::path& dir, std::string* error)
    {
        if (isDangerousPath(dir))
        {
            if (error) *error = "Refuse to clear dangerous path: " + dir.string();
            LOG(ERROR) << "Refuse to clear dangerous path: " << dir.string();
            return false;
        }

        std::error_code ec;
        if (!fs::is_directory(dir, ec))
        {
            if (error) *error = "Not a directory: " + dir.string();
            return false;
        }

        clearAttributesRecursive(dir);

        std::vector<fs::path> entries;
        fs::directory_iterator it(dir, ec);
        fs::directory_iterator end;
        for (; !ec && it != end; it.increment(ec))
            entries.push_back(it->path());

        if (ec)
        {
            if (error) *error = "Failed to enumerate '" + dir.string() + "': " + ec.message();
            return false;
        }

        for (const auto& p : entries)
        {
            (void)fs::remove_all(p, ec);
            if (ec)
            {
                if (error) *error = "remove_all failed for '" + p.string() + "': " + ec.message();
                LOG(ERROR) << "remove_all failed for '" << p.string() << "': " << ec.message();
                return false;
            }
        }
        return true;
    }

    //---Права на каталог наследуются из ACL родителя: владельца не переносим
    DirOwner readOwner(const fs::path&)
    {
        return {};
    }

    bool applyOwner(const fs::path&, const DirOwner&, std::string*)
    {
        return true;
    }

} // namespace jfbak::platform

#endif // _WIN32
