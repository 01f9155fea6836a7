#pragma once
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "jellyfin_backup/ArchiveToolProvisioner.hpp"
#include "jellyfin_backup/CommandRunner.hpp"
#include "jellyfin_backup/Downloader.hpp"
#include "jellyfin_backup/IProcessControl.hpp"
#include "jellyfin_backup/IServiceBackend.hpp"
#include "jellyfin_backup/ITaskScheduler.hpp"
#include "jellyfin_backup/ServiceController.hpp"

namespace jfbak::test {

	class MockCommandRunner : public ICommandRunner {
	public:
		MOCK_METHOD(bool, run, (const fs::path& exe, const std::vector<std::string>& args,
			process::RunResult& out, const process::RunOptions& opt), (override));
	};

	class MockDownloader : public IDownloader {
	public:
		MOCK_METHOD(bool, download, (const std::string& url, const fs::path& dest, std::string* error), (override));
	};

	class MockToolProvisioner : public IToolProvisioner {
	public:
		MOCK_METHOD(bool, ensureTool, (fs::path& tool, std::string* error), (override));
	};

	class MockServiceController : public IServiceController {
	public:
		MOCK_METHOD(StopOutcome, stop, (), (override));
		MOCK_METHOD(StartOutcome, start, (), (override));
	};

	class MockServiceBackend : public IServiceBackend {
	public:
		MOCK_METHOD(bool, exists, (const std::string& name, bool& exists, std::string* error), (override));
		MOCK_METHOD(bool, start, (const std::string& name, std::string* error), (override));
		MOCK_METHOD(bool, stop, (const std::string& name, std::string* error), (override));
	};

	class MockProcessControl : public IProcessControl {
	public:
		MOCK_METHOD(bool, isRunning, (const std::string& name), (override));
		MOCK_METHOD(bool, killAll, (const std::string& name, std::string* error), (override));
		MOCK_METHOD(bool, launchDetached, (const fs::path& exe, std::string* error), (override));
	};

	class MockTaskScheduler : public ITaskScheduler {
	public:
		MOCK_METHOD(bool, remove, (const std::string& name, std::string* error), (override));
		MOCK_METHOD(bool, create, (const ScheduledTask& task, std::string* error), (override));
	};

	//---Успешный запуск процесса с заданным кодом возврата
	inline void finished(process::RunResult& out, int exitCode) {
		out = {};
		out.started = true;
		out.exitCode = exitCode;
	}

	//---Файл с содержимым (каталоги создаются)
	inline void writeFile(const fs::path& p, const std::string& content) {
		fs::create_directories(p.parent_path());
		std::ofstream(p, std::ios::binary) << content;
	}

	//---Число элементов в каталоге
	inline size_t entryCount(const fs::path& dir) {
		size_t n = 0;
		for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) n++;
		return n;
	}

};//---namespace jfbak::test
