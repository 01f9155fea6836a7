#pragma once
#include <filesystem>
#include <string>

namespace jfbak {

	namespace fs = std::filesystem;

	//---Загрузка файла по HTTP(S)
	class IDownloader {
	public:
		virtual ~IDownloader() = default;

		virtual bool download(const std::string& url, const fs::path& dest, std::string* error) = 0;
	};

	//---Реализация на cpr. Блокирующая, без таймаута
	class HttpDownloader final : public IDownloader {
	public:
		bool download(const std::string& url, const fs::path& dest, std::string* error) override;
	};

};//---namespace jfbak
