#if defined(__linux__)
#include "platform/PlatformImpl.hpp"
#include "jellyfin_backup/ArchiveToolProvisioner.hpp"

#include <cstdlib>
#include <pwd.h>
#include <sys/stat.h>
#include <time.h>
#include <unistd.h>
#include <vector>

namespace jfbak::platform {

	namespace {
		//---Домашний каталог: $HOME, иначе из passwd
		static fs::path homeDir()
		{
			if (const char* h = std::getenv("HOME"); h && *h) return fs::path(h);
			if (const passwd* pw = ::getpwuid(::geteuid()); pw && pw->pw_dir) return fs::path(pw->pw_dir);
			return {};
		}
	} // namespace

	//---Получение пути к собственному исполняемому файлу
	fs::path selfExePath()
	{
		std::vector<char> buf(4096, '\0');
		ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
		if (n <= 0) return {};
		buf[(size_t)n] = '\0';
		return fs::path(buf.data());
	}
	//---Проверка, что процесс запущен с правами root
	bool isElevated()
	{
		return ::geteuid() == 0;
	}

	//---Пакет jellyfin-server хранит данные здесь
	fs::path systemDataDir()
	{
		return "/var/lib/jellyfin";
	}

	fs::path userDataRoot()
	{
		if (const char* x = std::getenv("XDG_DATA_HOME"); x && *x) return fs::path(x);
		const fs::path home = homeDir();
		return home.empty() ? fs::path{} : home / ".local" / "share";
	}

	//---Распакованный tarball сервера в домашнем каталоге
	fs::path defaultUserExe()
	{
		const fs::path home = homeDir();
		return home.empty() ? fs::path{} : home / ".local" / "opt" / "jellyfin" / "jellyfin";
	}

	std::string defaultServiceName() { return "jellyfin"; }
	std::string defaultProcessName() { return "jellyfin"; }

	//---7zz - полный 7-Zip, 7za - урезанная версия
	std::vector<std::string> archiverExeNames() { return { "7zz", "7za" }; }

	std::string defaultToolUrl() { return "https://www.7-zip.org/a/7z2301-linux-x64.tar.xz"; }

	//---GNU tar сам определяет xz; bsdtar (libarchive) - запасной вариант
	std::vector<ExtractStrategy> extractStrategies()
	{
		auto tarArgs = [](const fs::path& archive, const fs::path& outDir) {
			return std::vector<std::string>{ "-xf", archive.string(), "-C", outDir.string() };
		};
		return {
			{ "tar", "/bin/tar", tarArgs },
			{ "bsdtar", "/usr/bin/bsdtar", tarArgs },
		};
	}

	bool toLocalTime(std::time_t t, std::tm& out)
	{
		return ::localtime_r(&t, &out) != nullptr;
	}

	bool toUtcTime(std::time_t t, std::tm& out)
	{
		return ::gmtime_r(&t, &out) != nullptr;
	}

	//---Пользователь, запустивший программу (под sudo - $SUDO_USER).
	//	Возвращается, только если ему принадлежит каталог данных: системная
	//	установка остаётся за root, иначе службу нельзя остановить
	std::string scheduleAccount(const fs::path& dataDir)
	{
		std::string name;
		if (::geteuid() == 0)
		{
			if (const char* s = std::getenv("SUDO_USER"); s && *s) name = s;
		}
		if (name.empty())
		{
			if (const passwd* pw = ::getpwuid(::geteuid()); pw && pw->pw_name) name = pw->pw_name;
		}
		if (name.empty()) return {};

		const passwd* pw = ::getpwnam(name.c_str());
		if (!pw || pw->pw_uid == 0) return {};

		struct stat st {};
		if (::stat(dataDir.c_str(), &st) != 0 || st.st_uid != pw->pw_uid) return {};
		return name;
	}

} // namespace jfbak::platform
#endif
