#pragma once
#if defined(__linux__)

#include <ctime>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

#include "jellyfin_backup/ITaskScheduler.hpp"

namespace jfbak::platform::systemd {

    namespace fs = std::filesystem;

    //---Каталог системных unit-файлов
    inline const fs::path kUnitDir = "/etc/systemd/system";

    //---Имена unit: [A-Za-z0-9_.-], без пробелов и слэшей
    bool isValidUnitName(const std::string& name);

    //---Запуск systemctl; успех только для кодов из okExitCodes
    bool runSystemctl(const std::vector<std::string>& args,
        std::initializer_list<int> okExitCodes,
        std::string* error,
        const char* what);

    //---Код возврата systemctl (или -1, если не запустился)
    int systemctlExitCode(const std::vector<std::string>& args);

    //---Кавычки для ExecStart, если в строке есть пробелы или кавычки
    std::string quoteIfNeeded(const std::string& s);

    //---OnCalendar= для периодичности. Для Once - ближайшее hour:minute после now
    std::string onCalendarFor(Frequency f, int hour, int minute, const std::tm& now);

    //---Тексты unit-файлов задачи резервного копирования
    std::string renderServiceUnit(const ScheduledTask& task);
    std::string renderTimerUnit(const ScheduledTask& task, const std::tm& now);

    //---Запись файла unit целиком
    bool writeUnitFile(const fs::path& p, const std::string& content, std::string* error);

} // namespace jfbak::platform::systemd

#endif // __linux__
