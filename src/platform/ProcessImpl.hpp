#pragma once
#include "jellyfin_backup/Process.hpp"

namespace jfbak::process::detail {

// Платформенно-специфичная реализация запуска процесса
// Определяется в соответствующих файлах реализации:
//   - ProcessWin.cpp для Windows
//   - ProcessLinux.cpp для Linux
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt);

    bool spawnDetachedPlatform(const fs::path& exe, const std::vector<std::string>& args,
        std::string* error);

} // namespace jfbak::process::detail
