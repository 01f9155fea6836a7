#include "jellyfin_backup/Logging.hpp"

#include <system_error>
#include <glog/logging.h>

namespace jfbak {

	//---Инициализация логгера
	void initLogging(const char* programName, const std::filesystem::path& logDir) {

		//---Создание директории для логов
		std::error_code ec;
		if (!logDir.empty()) std::filesystem::create_directories(logDir, ec);

		google::SetLogFilenameExtension(".txt"); // Расширение
		google::SetLogDestination(google::GLOG_INFO, (logDir / "info").string().c_str()); // Путь и префикс файлов для каждого уровня
		google::SetLogDestination(google::GLOG_WARNING, (logDir / "warning").string().c_str());
		google::SetLogDestination(google::GLOG_ERROR, (logDir / "error").string().c_str());
		google::SetLogDestination(google::GLOG_FATAL, (logDir / "fatal").string().c_str());
		google::InitGoogleLogging(programName); // Инициализация

		//---Настройка вывода в консоль
		FLAGS_alsologtostderr = true;
		FLAGS_colorlogtostderr = true;

		if (ec) LOG(WARNING) << "Failed to create log directory " << logDir << ": " << ec.message();
	}

};//---namespace jfbak
