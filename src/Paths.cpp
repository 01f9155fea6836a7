#include "jellyfin_backup/Paths.hpp"
#include "platform/PlatformImpl.hpp"

#include <system_error>

namespace jfbak {

	//---Директория, в которой находится исполняемый файл
	fs::path selfDir() {

		const fs::path exe = platform::selfExePath();

		//---Родительская директория или текущая, если путь не определён
		if (!exe.empty())
		{
			return exe.parent_path();
		}
		return fs::current_path();
	}

	fs::path selfExe() {
		return platform::selfExePath();
	}

	//---Разрешение пути относительно selfDir
	fs::path resolveAgainstSelf(const std::string& arg, const fs::path& fallback) {

		if (arg.empty())
		{
			return fallback;
		}

		fs::path p(arg);
		if (p.is_relative())
		{
			p = (selfDir() / p).lexically_normal();
		}
		return p;
	}

	//---Кандидаты каталога данных в порядке приоритета
	std::vector<fs::path> dataDirCandidates(const std::string& overrideDir) {

		std::vector<fs::path> out;
		if (!overrideDir.empty()) out.push_back(resolveAgainstSelf(overrideDir, {}));

		out.push_back(platform::systemDataDir());

		//---Инсталляторы используют оба написания
		const fs::path user = platform::userDataRoot();
		if (!user.empty())
		{
			out.push_back(user / "jellyfin");
			out.push_back(user / "Jellyfin");
		}
		return out;
	}

	std::optional<fs::path> resolveDataDir(const std::vector<fs::path>& candidates, const ExistsFn& exists) {
		for (const auto& c : candidates)
		{
			if (c.empty()) continue;
			if (exists(c)) return c;
		}
		return std::nullopt;
	}

	std::optional<fs::path> resolveDataDir(const std::vector<fs::path>& candidates) {
		return resolveDataDir(candidates, [](const fs::path& p) {
			std::error_code ec;
			return fs::is_directory(p, ec);
		});
	}
} // namespace jfbak
