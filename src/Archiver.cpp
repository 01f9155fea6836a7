#include "jellyfin_backup/Archiver.hpp"
#include "platform/PlatformImpl.hpp"

#include <iomanip>
#include <sstream>

namespace jfbak::archiver {

	std::string archiveFileName(const std::tm& localTime) {
		std::ostringstream os;
		os << kArchivePrefix << std::put_time(&localTime, "%Y%m%d_%H%M%S") << kArchiveExt;
		return os.str();
	}

	std::string archiveFileName(std::chrono::system_clock::time_point when) {
		const std::time_t t = std::chrono::system_clock::to_time_t(when);
		std::tm tm{};
		//---Без локального часового пояса используем UTC, формат имени тот же
		if (!platform::toLocalTime(t, tm) && !platform::toUtcTime(t, tm))
		{
			//---Время не преобразуется: 1900-01-01 00:00:00
			tm = std::tm{};
			tm.tm_mday = 1;
		}
		return archiveFileName(tm);
	}

	std::vector<std::string> createArgs(const fs::path& archive, const fs::path& sourceDir) {
		return {
			"a",
			"-tzip",			//	контейнер zip
			"-mx=5",			//	умеренная степень сжатия
			"-mm=Deflate",
			"-y",				//	без вопросов
			archive.string(),
			(sourceDir / "*").string()	//	всё дерево с относительными путями
		};
	}

	std::vector<std::string> extractArgs(const fs::path& archive, const fs::path& outDir) {
		return {
			"x",				//	с полными путями
			archive.string(),
			"-o" + outDir.string(),
			"-y"
		};
	}

};//---namespace jfbak::archiver
