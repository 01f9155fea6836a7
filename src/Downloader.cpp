#include "jellyfin_backup/Downloader.hpp"

#include <cpr/cpr.h>
#include <glog/logging.h>

#include <fstream>
#include <system_error>

namespace jfbak {

	//------------------------------------------------------------
	//	Скачивание url → dest. При ошибке частичный файл удаляется
	//------------------------------------------------------------
	bool HttpDownloader::download(const std::string& url, const fs::path& dest, std::string* error)
	{
		LOG(INFO) << "Downloading " << url << " -> " << dest;

		std::ofstream out(dest, std::ios::binary | std::ios::trunc);
		if (!out.is_open())
		{
			if (error) *error = "Failed to create output file: " + dest.string();
			return false;
		}

		const cpr::Response response = cpr::Download(out, cpr::Url{ url });
		out.close();

		std::string err;
		if (response.error)
		{
			err = "Download failed: " + response.error.message;
		}
		else if (response.status_code != 200)
		{
			err = "Download failed with HTTP status " + std::to_string(response.status_code);
		}
		else if (!out)
		{
			err = "Failed to write downloaded file: " + dest.string();
		}

		if (!err.empty())
		{
			std::error_code ec;
			fs::remove(dest, ec);
			if (error) *error = err;
			return false;
		}

		LOG(INFO) << "Download completed: " << dest;
		return true;
	}

};//---namespace jfbak
