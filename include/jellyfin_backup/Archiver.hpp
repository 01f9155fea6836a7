#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace jfbak::archiver {

	namespace fs = std::filesystem;

	//---Префикс и расширение имени архива: JellyfinBackup_yyyyMMdd_HHmmss.zip
	inline constexpr const char* kArchivePrefix = "JellyfinBackup_";
	inline constexpr const char* kArchiveExt = ".zip";

	//---Имя архива по локальному времени
	std::string archiveFileName(const std::tm& localTime);
	std::string archiveFileName(std::chrono::system_clock::time_point when);

	//---7z a -tzip -mx=5 -mm=Deflate -y <archive> <sourceDir>/*
	std::vector<std::string> createArgs(const fs::path& archive, const fs::path& sourceDir);

	//---7z x <archive> -o<outDir> -y
	std::vector<std::string> extractArgs(const fs::path& archive, const fs::path& outDir);

};//---namespace jfbak::archiver
