#pragma once
#include <string>
#include <vector>
#include "Process.hpp"

namespace jfbak {

	//---Запуск внешних программ (архиватор, утилиты распаковки)
	//   Отдельный интерфейс, чтобы в тестах подменять реальные процессы
	class ICommandRunner {
	public:
		virtual ~ICommandRunner() = default;

		virtual bool run(const process::fs::path& exe, const std::vector<std::string>& args,
			process::RunResult& out, const process::RunOptions& opt) = 0;
	};

	//---Реализация через process::run
	class SystemCommandRunner final : public ICommandRunner {
	public:
		bool run(const process::fs::path& exe, const std::vector<std::string>& args,
			process::RunResult& out, const process::RunOptions& opt) override;
	};

};//---namespace jfbak
