#include "jellyfin_backup/Process.hpp"
#include "platform/ProcessImpl.hpp"

namespace jfbak::process {

// Оболочка над платформенно-специфичной реализацией (ProcessWin.cpp / ProcessLinux.cpp)
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        return detail::runPlatform(exe, args, out, opt);
    }

    bool spawnDetached(const fs::path& exe, const std::vector<std::string>& args, std::string* error)
    {
        return detail::spawnDetachedPlatform(exe, args, error);
    }

} // namespace jfbak::process
