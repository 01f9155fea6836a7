#include "jellyfin_backup/Cli.hpp"
#include <iomanip>
#include <string_view>

namespace jfbak {

	namespace {
		//---Известные ключи вида --key=value
		constexpr std::string_view kValueKeys[] = {
			"--data-dir", "--backup-dir", "--tool-dir", "--tool-url", "--service-name"
		};
		//---Известные флаги
		constexpr std::string_view kFlags[] = {
			kBackupOnlyFlag, "--no-delay", "--help", "-h"
		};
	} // namespace

	//------------------------------------------------------------
	//	Проверка, что строка начинается с префикса
	//------------------------------------------------------------
	static bool startsWith(std::string_view s, std::string_view p) {
		return s.size() >= p.size() && s.substr(0, p.size()) == p;
	}
	//------------------------------------------------------------
	//	Удаление кавычек в начале и конце строки
	//------------------------------------------------------------
	static std::string trimQuotes(std::string v) {

		if (v.size() < 2) return v;

		const bool dbl = (v.front() == '"' && v.back() == '"');
		const bool sgl = (v.front() == '\'' && v.back() == '\'');

		if (dbl || sgl) v = v.substr(1, v.size() - 2);

		return v;
	}
	//------------------------------------------------------------
	//	Получение значения ключа из аргументов командной строки
	//------------------------------------------------------------
	static std::string getKv(int argc, char** argv, std::string_view key) {

		const std::string prefix = std::string(key) + "=";

		for (int i = 1; i < argc; i++)
		{
			std::string_view a = argv[i];
			if (startsWith(a, prefix))
			{
				return trimQuotes(std::string(a.substr(prefix.size())));
			}
		}
		return{};
	}
	//------------------------------------------------------------
	//	Проверка наличия флага в аргументах командной строки
	//------------------------------------------------------------
	static bool hasFlag(int argc, char** argv, std::string_view flag) {
		for (int i = 1; i < argc; i++)
		{
			if (std::string_view(argv[i]) == flag) return true;
		}
		return false;
	}
	//------------------------------------------------------------
	//	Аргумент распознан (флаг или --key=value)?
	//------------------------------------------------------------
	static bool isKnownArg(std::string_view a) {
		for (std::string_view f : kFlags)
		{
			if (a == f) return true;
		}
		for (std::string_view k : kValueKeys)
		{
			if (startsWith(a, k) && a.size() > k.size() && a[k.size()] == '=') return true;
		}
		return false;
	}
	//------------------------------------------------------------
	//---Парсинг опций командной строки
	//------------------------------------------------------------
	CliOptions parseCli(int argc, char** argv) {

		CliOptions o;

		//---Неизвестный аргумент → Invalid
		for (int i = 1; i < argc; i++)
		{
			if (!isKnownArg(argv[i]))
			{
				o.cmd = Command::Invalid;
				return o;
			}
		}

		if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h"))
		{
			o.cmd = Command::Help;
			return o;
		}

		o.cmd = hasFlag(argc, argv, kBackupOnlyFlag) ? Command::BackupOnly : Command::Menu;
		o.noDelay = hasFlag(argc, argv, "--no-delay");

		o.dataDir = getKv(argc, argv, "--data-dir");
		o.backupDir = getKv(argc, argv, "--backup-dir");
		o.toolDir = getKv(argc, argv, "--tool-dir");
		o.toolUrl = getKv(argc, argv, "--tool-url");
		o.serviceName = getKv(argc, argv, "--service-name");

		return o;
	}
	//------------------------------------------------------------
	//	Вывод опции с описанием
	//------------------------------------------------------------
	static void printOpt(std::ostream& os, const std::string& opt, const std::string& desc, int w = 24)
	{
		os << "  " << std::left << std::setw(w) << opt << desc << "\n";
	}
	//------------------------------------------------------------
	//	Вывод справки по использованию
	//------------------------------------------------------------
	void printHelp(std::ostream& os)
	{
		os <<
			"jellyfin-backup\n\n"
			"Usage:\n"
			"  jellyfin-backup [options]\n\n"
			"Without options an interactive menu is shown (backup / restore / schedule / exit).\n\n"
			"Options:\n";

		printOpt(os, kBackupOnlyFlag, "Run one backup to the default folder and exit (used by the scheduled task)");
		printOpt(os, "--data-dir=<path>", "Jellyfin data directory (checked before the standard locations)");
		printOpt(os, "--backup-dir=<path>", "Default backup folder (default: <program dir>/Backups)");
		printOpt(os, "--tool-dir=<path>", "7-Zip folder (default: <program dir>/7zip)");
		printOpt(os, "--tool-url=<url>", "Portable 7-Zip download URL");
		printOpt(os, "--service-name=<name>", "Jellyfin service name");
		printOpt(os, "--no-delay", "Skip the grace period after stopping Jellyfin");
		printOpt(os, "--help", "Show this help");

		os <<
			"\nExamples:\n"
			"  jellyfin-backup\n"
			"  jellyfin-backup --backup-only\n"
			"  jellyfin-backup --backup-only --backup-dir=\"D:\\\\Backups\\\\Jellyfin\"\n";
	}
};//---namespace jfbak
