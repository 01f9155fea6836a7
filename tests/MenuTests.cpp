#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "Mocks.hpp"
#include "jellyfin_backup/AppConfig.hpp"
#include "jellyfin_backup/BackupExecutor.hpp"
#include "jellyfin_backup/Menu.hpp"
#include "jellyfin_backup/RestoreExecutor.hpp"
#include "jellyfin_backup/ScheduleManager.hpp"

using namespace jfbak;
using namespace jfbak::test;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::StrictMock;


class MenuTest : public ::testing::Test {
protected:
	fs::path testDir = fs::temp_directory_path() / "jfbak_menu_test";

	AppConfig cfg;
	StrictMock<MockServiceController> service;
	StrictMock<MockToolProvisioner> tools;
	StrictMock<MockCommandRunner> runner;
	StrictMock<MockTaskScheduler> scheduler;

	void SetUp() override {
		fs::remove_all(testDir);
		cfg.dataDir = testDir / "data";
		cfg.backupDir = testDir / "Backups";
		cfg.selfExe = testDir / "jellyfin-backup";
		writeFile(cfg.dataDir / "library.db", "current");
	}

	void TearDown() override {
		std::error_code ec;
		fs::remove_all(testDir, ec);
	}

	std::string run(const std::string& input) {
		BackupExecutor backup(cfg, service, tools, runner);
		RestoreExecutor restore(cfg, service, tools, runner);
		ScheduleManager schedule(cfg, scheduler);

		std::istringstream in(input);
		std::ostringstream out;
		runMenu(in, out, backup, restore, schedule);
		return out.str();
	}
};

TEST_F(MenuTest, ExitDoesNothing) {
	EXPECT_THAT(run("4\n"), HasSubstr("4. Exit"));
}

TEST_F(MenuTest, EndOfInputEndsMenu) {
	run("");
}

TEST_F(MenuTest, UnknownChoice) {
	EXPECT_THAT(run("9\n4\n"), HasSubstr("Unknown choice"));
}

TEST_F(MenuTest, EmptyRestorePathCancels) {
	EXPECT_THAT(run("2\n\n4\n"), HasSubstr("Restore cancelled"));
	EXPECT_TRUE(fs::exists(cfg.dataDir / "library.db"));
}

TEST_F(MenuTest, RestoreRequiresConfirmation) {
	writeFile(testDir / "backup.zip", "PK");
	const std::string out = run("2\n" + (testDir / "backup.zip").string() + "\nno\n4\n");

	EXPECT_THAT(out, HasSubstr("Type 'yes'"));
	EXPECT_THAT(out, HasSubstr("Restore cancelled"));
	EXPECT_TRUE(fs::exists(cfg.dataDir / "library.db"));
}

TEST_F(MenuTest, EmptyCustomBackupFolderCancels) {
	EXPECT_CALL(service, stop()).WillOnce(Return(StopOutcome::NotRunning));
	EXPECT_CALL(service, start()).WillOnce(Return(StartOutcome::ManualStartRequired));

	EXPECT_THAT(run("1\n2\n\n4\n"), HasSubstr("Backup cancelled"));
}

TEST_F(MenuTest, InvalidFrequencyIsReported) {
	EXPECT_THAT(run("3\nx\n4\n"), HasSubstr("Schedule not changed"));
}

TEST_F(MenuTest, ScheduleDaily) {
	EXPECT_CALL(scheduler, remove("JellyfinBackup", _)).WillOnce(Return(true));
	EXPECT_CALL(scheduler, create(_, _)).WillOnce(Return(true));

	EXPECT_THAT(run("3\nd\n4\n"), HasSubstr("DAILY at 03:00"));
}
