#include "jellyfin_backup/CommandRunner.hpp"

namespace jfbak {

	bool SystemCommandRunner::run(const process::fs::path& exe, const std::vector<std::string>& args,
		process::RunResult& out, const process::RunOptions& opt)
	{
		return process::run(exe, args, out, opt);
	}

};//---namespace jfbak
