#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>
#if defined(__linux__)
#include <sys/stat.h>
#include <unistd.h>
#endif

#include "Mocks.hpp"
#include "jellyfin_backup/AppConfig.hpp"
#include "jellyfin_backup/RestoreExecutor.hpp"

using namespace jfbak;
using namespace jfbak::test;
using ::testing::_;
using ::testing::DoAll;
using ::testing::ElementsAre;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::SetArgReferee;
using ::testing::StrictMock;


class RestoreExecutorTest : public ::testing::Test {
protected:
	fs::path testDir = fs::temp_directory_path() / "jfbak_restore_test";
	fs::path tool = testDir / "7zip" / "7za";
	fs::path archive = testDir / "Backups" / "JellyfinBackup_20240305_030000.zip";

	AppConfig cfg;
	StrictMock<MockServiceController> service;
	StrictMock<MockToolProvisioner> tools;
	StrictMock<MockCommandRunner> runner;

	void SetUp() override {
		fs::remove_all(testDir);
		cfg.dataDir = testDir / "data";
		writeFile(cfg.dataDir / "library.db", "current");
		writeFile(cfg.dataDir / "metadata" / "poster.jpg", "current");
		writeFile(archive, "PK");
	}

	void TearDown() override {
		std::error_code ec;
		fs::remove_all(testDir, ec);
	}

	void expectStopStart() {
		EXPECT_CALL(service, stop()).WillOnce(Return(StopOutcome::Stopped));
		EXPECT_CALL(service, start()).Times(1).WillOnce(Return(StartOutcome::Started));
	}

	void toolAvailable() {
		EXPECT_CALL(tools, ensureTool(_, _)).WillOnce(DoAll(SetArgReferee<0>(tool), Return(true)));
	}

	static std::string readFile(const fs::path& p) {
		std::ifstream f(p, std::ios::binary);
		return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
	}
};

TEST_F(RestoreExecutorTest, NoSelectionTouchesNothing) {
	RestoreExecutor restore(cfg, service, tools, runner);

	const RestoreResult none = restore.run(std::nullopt);
	const RestoreResult empty = restore.run(fs::path{});

	EXPECT_EQ(none.status, RestoreStatus::Cancelled);
	EXPECT_EQ(empty.status, RestoreStatus::Cancelled);
	EXPECT_FALSE(none.serviceTouched);
	EXPECT_EQ(readFile(cfg.dataDir / "library.db"), "current");
	EXPECT_TRUE(fs::exists(cfg.dataDir / "metadata" / "poster.jpg"));
}

TEST_F(RestoreExecutorTest, MissingArchiveTouchesNothing) {
	RestoreExecutor restore(cfg, service, tools, runner);

	const RestoreResult r = restore.run(testDir / "nope.zip");

	EXPECT_EQ(r.status, RestoreStatus::ArchiveMissing);
	EXPECT_FALSE(r.serviceTouched);
	EXPECT_EQ(readFile(cfg.dataDir / "library.db"), "current");
}

TEST_F(RestoreExecutorTest, ReplacesDataDirectoryContents) {
	RestoreExecutor restore(cfg, service, tools, runner);
	{
		::testing::InSequence seq;
		EXPECT_CALL(service, stop()).WillOnce(Return(StopOutcome::Stopped));
		EXPECT_CALL(tools, ensureTool(_, _)).WillOnce(DoAll(SetArgReferee<0>(tool), Return(true)));
		EXPECT_CALL(runner, run(tool, ElementsAre("x", archive.string(), "-o" + cfg.dataDir.string(), "-y"), _, _))
			.WillOnce(Invoke([this](const fs::path&, const std::vector<std::string>&, process::RunResult& out, const process::RunOptions&) {
				//---К моменту распаковки старое содержимое уже удалено
				EXPECT_TRUE(fs::is_directory(cfg.dataDir));
				EXPECT_EQ(entryCount(cfg.dataDir), 0u);
				writeFile(cfg.dataDir / "library.db", "restored");
				finished(out, 0);
				return true;
			}));
		EXPECT_CALL(service, start()).WillOnce(Return(StartOutcome::Started));
	}

	const RestoreResult r = restore.run(archive);

	ASSERT_TRUE(r.ok()) << r.error;
	EXPECT_TRUE(r.serviceTouched);
	EXPECT_EQ(readFile(cfg.dataDir / "library.db"), "restored");
	EXPECT_FALSE(fs::exists(cfg.dataDir / "metadata"));
}

TEST_F(RestoreExecutorTest, ExtractFailureStillRestartsServer) {
	RestoreExecutor restore(cfg, service, tools, runner);
	expectStopStart();
	toolAvailable();
	EXPECT_CALL(runner, run(tool, _, _, _))
		.WillOnce(Invoke([](const fs::path&, const std::vector<std::string>&, process::RunResult& out, const process::RunOptions&) {
			finished(out, 2);
			return true;
		}));

	const RestoreResult r = restore.run(archive);

	EXPECT_EQ(r.status, RestoreStatus::ArchiveFailed);
	EXPECT_EQ(r.exitCode, 2);
	EXPECT_EQ(r.start, StartOutcome::Started);
}

TEST_F(RestoreExecutorTest, MissingArchiverStillRestartsServer) {
	RestoreExecutor restore(cfg, service, tools, runner);
	expectStopStart();
	EXPECT_CALL(tools, ensureTool(_, _)).WillOnce(Return(false));

	const RestoreResult r = restore.run(archive);

	EXPECT_EQ(r.status, RestoreStatus::AcquisitionFailed);
}

TEST_F(RestoreExecutorTest, UnclearableDataDirectory) {
	cfg.dataDir = testDir / "absent";
	RestoreExecutor restore(cfg, service, tools, runner);
	expectStopStart();

	const RestoreResult r = restore.run(archive);

	EXPECT_EQ(r.status, RestoreStatus::ClearFailed);
	EXPECT_FALSE(r.error.empty());
}

#if defined(__linux__)
TEST_F(RestoreExecutorTest, RestoredTreeGetsDataDirectoryOwner) {
	if (::geteuid() != 0) GTEST_SKIP() << "changing file owners requires root";

	//---Каталог данных принадлежит учётной записи сервера (nobody)
	const uid_t serverUid = 65534;
	const gid_t serverGid = 65534;
	ASSERT_EQ(::chown(cfg.dataDir.c_str(), serverUid, serverGid), 0);

	RestoreExecutor restore(cfg, service, tools, runner);
	expectStopStart();
	toolAvailable();
	EXPECT_CALL(runner, run(tool, _, _, _))
		.WillOnce(Invoke([this](const fs::path&, const std::vector<std::string>&, process::RunResult& out, const process::RunOptions&) {
			//---Архиватор создаёт файлы от root
			writeFile(cfg.dataDir / "data" / "library.db", "restored");
			finished(out, 0);
			return true;
		}));

	const RestoreResult r = restore.run(archive);
	ASSERT_TRUE(r.ok()) << r.error;

	for (const fs::path& p : { cfg.dataDir, cfg.dataDir / "data", cfg.dataDir / "data" / "library.db" })
	{
		struct stat st {};
		ASSERT_EQ(::lstat(p.c_str(), &st), 0) << p;
		EXPECT_EQ(st.st_uid, serverUid) << p;
		EXPECT_EQ(st.st_gid, serverGid) << p;
	}
}
#endif
