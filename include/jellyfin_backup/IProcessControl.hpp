#pragma once
#include <filesystem>
#include <string>

namespace jfbak {

	namespace fs = std::filesystem;

	//---Управление обычными процессами (когда сервер запущен не как служба)
	class IProcessControl {
	public:
		virtual ~IProcessControl() = default;

		//---name - имя исполняемого файла ("jellyfin" / "jellyfin.exe"), без учёта регистра
		virtual bool isRunning(const std::string& name) = 0;
		//---Принудительно завершить все процессы с таким именем
		virtual bool killAll(const std::string& name, std::string* error) = 0;
		virtual bool launchDetached(const fs::path& exe, std::string* error) = 0;
	};
};//---namespace jfbak
