#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace jfbak {

	namespace fs = std::filesystem;

	//---Директория, в которой находится исполняемый файл (зависит от платформы)
	fs::path selfDir();

	//---Путь к собственному исполняемому файлу (для задачи планировщика)
	fs::path selfExe();

	//--Разрешение пути из командной строки:
	//	Если arg пустой → fallback
	//	Если arg относительный → selfDir() / arg
	//	Если arg абсолютный → без изменений
	fs::path resolveAgainstSelf(const std::string& arg, const fs::path& fallback);

	//---Кандидаты каталога данных в порядке приоритета:
	//	override (если задан), системный каталог, пользовательский "jellyfin", пользовательский "Jellyfin"
	std::vector<fs::path> dataDirCandidates(const std::string& overrideDir);

	using ExistsFn = std::function<bool(const fs::path&)>;

	//---Первый существующий кандидат. После совпадения остальные не проверяются
	std::optional<fs::path> resolveDataDir(const std::vector<fs::path>& candidates, const ExistsFn& exists);

	//---То же с проверкой через файловую систему (каталог существует)
	std::optional<fs::path> resolveDataDir(const std::vector<fs::path>& candidates);

};//---namespace jfbak
