#if defined(__linux__)

#include "platform/PlatformImpl.hpp"

#include <cerrno>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

namespace jfbak::platform {
    namespace fs = std::filesystem;

    //---Не даём очистить "/" и пустой путь
    static bool isDangerousPath(const fs::path& p)
    {
        if (p.empty()) return true;

        std::error_code ec;
        fs::path abs = fs::absolute(p, ec);
        if (ec) abs = p;
        abs = abs.lexically_normal();

        if (abs == abs.root_path()) return true; // "/"
        if (abs.string().size() <= 1) return true;

        return false;
    }

    //---Удалить содержимое каталога. Сам каталог (и его права) сохраняется
    bool clearDirectory(const fs::path& dir, std::string* error)
    {
        if (isDangerousPath(dir))
        {
            if (error) *error = "Refuse to clear dangerous path: " + dir.string();
            return false;
        }

        std::error_code ec;
        if (!fs::is_directory(dir, ec))
        {
            if (error) *error = "Not a directory: " + dir.string();
            return false;
        }

        //---Сначала список, потом удаление: не меняем каталог во время обхода
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
                return false;
            }
        }
        return true;
    }

    DirOwner readOwner(const fs::path& dir)
    {
        DirOwner o;
        struct stat st {};
        if (::stat(dir.c_str(), &st) != 0) return o;
        o.known = true;
        o.uid = st.st_uid;
        o.gid = st.st_gid;
        return o;
    }

    //---Владелец одного элемента: меняем только если отличается
    static bool chownEntry(const fs::path& p, const DirOwner& owner, std::string* error)
    {
        struct stat st {};
        if (::lstat(p.c_str(), &st) != 0)
        {
            if (error) *error = "lstat failed for '" + p.string() + "': " + std::error_code(errno, std::generic_category()).message();
            return false;
        }
        if (st.st_uid == owner.uid && st.st_gid == owner.gid) return true;

        if (::lchown(p.c_str(), owner.uid, owner.gid) != 0)
        {
            if (error) *error = "lchown failed for '" + p.string() + "': " + std::error_code(errno, std::generic_category()).message();
            return false;
        }
        return true;
    }

    bool applyOwner(const fs::path& dir, const DirOwner& owner, std::string* error)
    {
        if (!owner.known) return true;
        if (!chownEntry(dir, owner, error)) return false;

        std::error_code ec;
        fs::recursive_directory_iterator it(dir, ec);
        fs::recursive_directory_iterator end;
        for (; !ec && it != end; it.increment(ec))
        {
            if (!chownEntry(it->path(), owner, error)) return false;
        }
        if (ec)
        {
            if (error) *error = "Failed to enumerate '" + dir.string() + "': " + ec.message();
            return false;
        }
        return true;
    }

} // namespace jfbak::platform

#endif
