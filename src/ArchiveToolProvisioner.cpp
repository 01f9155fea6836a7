#include "jellyfin_backup/ArchiveToolProvisioner.hpp"
#include "jellyfin_backup/CommandRunner.hpp"
#include "jellyfin_backup/Downloader.hpp"
#include "platform/PlatformImpl.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <system_error>
#include <glog/logging.h>

namespace jfbak {

	namespace {
		//------------------------------------------------------------
		//	Сравнение имён файлов без учёта регистра
		//------------------------------------------------------------
		static bool sameName(const std::string& a, const std::string& b)
		{
			return a.size() == b.size() &&
				std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
					return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
				});
		}
		//------------------------------------------------------------
		//	Имя файла из URL (последний сегмент без query)
		//------------------------------------------------------------
		static std::string fileNameFromUrl(const std::string& url)
		{
			std::string s = url.substr(0, url.find_first_of("?#"));
			const auto slash = s.find_last_of('/');
			if (slash != std::string::npos) s = s.substr(slash + 1);
			return s.empty() ? std::string("7zip-download") : s;
		}
		//------------------------------------------------------------
		//	Уникальный временный каталог для загрузки и распаковки
		//------------------------------------------------------------
		static fs::path makeWorkDir(const fs::path& tempRoot)
		{
			std::error_code ec;
			fs::path root = tempRoot;
			if (root.empty()) root = fs::temp_directory_path(ec);
			if (ec || root.empty()) root = fs::current_path();

			const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
			return root / ("jellyfin-backup-7zip-" + std::to_string(ticks));
		}
		//------------------------------------------------------------
		//	Пересоздать пустой каталог
		//------------------------------------------------------------
		static bool recreateDir(const fs::path& dir, std::string* error)
		{
			std::error_code ec;
			fs::remove_all(dir, ec);
			ec.clear();
			fs::create_directories(dir, ec);
			if (ec)
			{
				if (error) *error = "Failed to create " + dir.string() + ": " + ec.message();
				return false;
			}
			return true;
		}
	} // namespace

	ArchiveToolProvisioner::ArchiveToolProvisioner(ToolSource source, IDownloader& downloader, ICommandRunner& runner)
		: source_(std::move(source)), downloader_(downloader), runner_(runner)
	{
	}

	//------------------------------------------------------------
	//	Уже установленный архиватор (первое имя по приоритету)
	//------------------------------------------------------------
	fs::path ArchiveToolProvisioner::findInstalled() const
	{
		for (const auto& name : source_.exeNames)
		{
			const fs::path p = source_.toolDir / name;
			std::error_code ec;
			if (fs::is_regular_file(p, ec)) return p;
		}
		return {};
	}

	//------------------------------------------------------------
	//	Поиск исполняемого файла в распакованном дереве.
	//	Приоритет по порядку имён, а не по порядку обхода
	//------------------------------------------------------------
	fs::path ArchiveToolProvisioner::findInTree(const fs::path& root) const
	{
		std::vector<fs::path> found(source_.exeNames.size());

		std::error_code ec;
		fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
		fs::recursive_directory_iterator end;
		while (!ec && it != end)
		{
			std::error_code fec;
			if (it->is_regular_file(fec))
			{
				const std::string fname = it->path().filename().string();
				for (size_t i = 0; i < source_.exeNames.size(); i++)
				{
					if (found[i].empty() && sameName(fname, source_.exeNames[i])) found[i] = it->path();
				}
			}
			it.increment(ec);
		}

		for (const auto& p : found)
		{
			if (!p.empty()) return p;
		}
		return {};
	}

	//------------------------------------------------------------
	//	Одна стратегия распаковки
	//------------------------------------------------------------
	StrategyOutcome ArchiveToolProvisioner::tryExtract(const ExtractStrategy& s, const fs::path& archive, const fs::path& outDir)
	{
		std::error_code ec;
		if (s.exe.empty() || !fs::exists(s.exe, ec)) return StrategyOutcome::NotApplicable;

		process::RunResult rr;
		const bool ok = runner_.run(s.exe, s.args(archive, outDir), rr, process::RunOptions{ .hideWindow = true });
		if (!ok || !rr.started)
		{
			LOG(WARNING) << s.name << ": failed to start " << s.exe << ", sysError=" << rr.sysError;
			return StrategyOutcome::Failed;
		}
		if (rr.exitCode != 0)
		{
			LOG(WARNING) << s.name << ": exitCode=" << rr.exitCode;
			return StrategyOutcome::Failed;
		}
		return StrategyOutcome::Succeeded;
	}

	//------------------------------------------------------------
	//	Распаковка: стратегии по порядку до первой успешной
	//------------------------------------------------------------
	bool ArchiveToolProvisioner::extract(const fs::path& archive, const fs::path& outDir, std::string* error)
	{
		std::ostringstream tried;
		for (const auto& s : source_.strategies)
		{
			//---Каждая попытка в чистый каталог
			if (!recreateDir(outDir, error)) return false;

			const StrategyOutcome o = tryExtract(s, archive, outDir);
			LOG(INFO) << "Extract with " << s.name << ": " << toString(o);
			if (o == StrategyOutcome::Succeeded) return true;

			tried << (tried.tellp() > 0 ? ", " : "") << s.name << " (" << toString(o) << ")";
		}

		if (error) *error = "No extraction method succeeded. Tried: " + (tried.str().empty() ? std::string("none") : tried.str());
		return false;
	}

	//------------------------------------------------------------
	//	Оркестратор: проверка → загрузка → распаковка → копирование
	//------------------------------------------------------------
	bool ArchiveToolProvisioner::ensureTool(fs::path& tool, std::string* error)
	{
		//---1) Быстрый путь: уже есть
		tool = findInstalled();
		if (!tool.empty()) return true;

		LOG(INFO) << "Archiver not found in " << source_.toolDir << ", acquiring portable 7-Zip";

		std::string err;
		const fs::path work = makeWorkDir(source_.tempRoot);

		auto acquire = [&]() -> bool {
			//---2) Каталог инструмента и временный каталог
			std::error_code ec;
			fs::create_directories(source_.toolDir, ec);
			if (ec)
			{
				err = "Failed to create " + source_.toolDir.string() + ": " + ec.message();
				return false;
			}
			if (!recreateDir(work, &err)) return false;

			//---Загрузка
			const fs::path archive = work / fileNameFromUrl(source_.url);
			if (!downloader_.download(source_.url, archive, &err)) return false;

			//---3) Распаковка
			const fs::path extracted = work / "extracted";
			if (!extract(archive, extracted, &err)) return false;

			//---4) Поиск и копирование исполняемого файла
			const fs::path match = findInTree(extracted);
			if (match.empty())
			{
				err = "Archiver executable not found in the downloaded distribution";
				return false;
			}

			//---Копия под каноническим именем: findInstalled ищет именно его
			std::string name = match.filename().string();
			for (const auto& n : source_.exeNames)
			{
				if (sameName(name, n)) { name = n; break; }
			}
			const fs::path dst = source_.toolDir / name;
			fs::copy_file(match, dst, fs::copy_options::overwrite_existing, ec);
			if (ec)
			{
				err = "Failed to copy " + match.string() + " to " + dst.string() + ": " + ec.message();
				return false;
			}
#ifndef _WIN32
			fs::permissions(dst, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
				fs::perm_options::add, ec);
			if (ec) LOG(WARNING) << "Failed to mark " << dst << " executable: " << ec.message();
#endif
			LOG(INFO) << "Archiver installed: " << dst;
			return true;
		};

		if (!acquire()) LOG(ERROR) << "Archiver acquisition failed: " << err;

		//---5) Уборка временных файлов при любом исходе
		{
			std::error_code ec;
			fs::remove_all(work, ec);
			if (ec) LOG(WARNING) << "Failed to remove temporary directory " << work << ": " << ec.message();
		}

		//---6) Повторная проверка
		tool = findInstalled();
		if (!tool.empty()) return true;

		std::ostringstream os;
		os << (err.empty() ? std::string("Archiver is not available") : err)
			<< ". Download 7-Zip manually from " << source_.url
			<< " and place one of [";
		for (size_t i = 0; i < source_.exeNames.size(); i++) os << (i ? ", " : "") << source_.exeNames[i];
		os << "] into " << source_.toolDir.string();

		LOG(ERROR) << os.str();
		if (error) *error = os.str();
		return false;
	}

	//------------------------------------------------------------
	//	Источник по умолчанию для текущей платформы
	//------------------------------------------------------------
	ToolSource defaultToolSource(const fs::path& toolDir, const std::string& url, const std::vector<std::string>& exeNames)
	{
		ToolSource s;
		s.toolDir = toolDir;
		s.url = url;
		s.exeNames = exeNames;
		s.strategies = platform::extractStrategies();
		return s;
	}

};//---namespace jfbak
