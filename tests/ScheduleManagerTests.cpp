#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include <utility>

#include "Mocks.hpp"
#include "jellyfin_backup/AppConfig.hpp"
#include "jellyfin_backup/Cli.hpp"
#include "jellyfin_backup/ScheduleManager.hpp"

using namespace jfbak;
using namespace jfbak::test;
using ::testing::_;
using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StrictMock;


TEST(FrequencyTest, CodesMapToFrequencies) {
	const std::pair<const char*, Frequency> cases[] = {
		{ "d", Frequency::Daily }, { "D", Frequency::Daily },
		{ "w", Frequency::Weekly }, { "W", Frequency::Weekly },
		{ "m", Frequency::Monthly }, { "M", Frequency::Monthly },
		{ "y", Frequency::Once }, { "Y", Frequency::Once },
	};
	for (const auto& [code, expected] : cases)
	{
		const auto f = parseFrequency(code);
		ASSERT_TRUE(f.has_value()) << code;
		EXPECT_EQ(*f, expected) << code;
	}
}

TEST(FrequencyTest, EverythingElseIsRejected) {
	for (const char* code : { "", "x", "dd", "daily", " d", "1" })
	{
		EXPECT_FALSE(parseFrequency(code).has_value()) << "'" << code << "'";
	}
}

TEST(FrequencyTest, SchedulerNames) {
	EXPECT_STREQ(toString(Frequency::Daily), "DAILY");
	EXPECT_STREQ(toString(Frequency::Weekly), "WEEKLY");
	EXPECT_STREQ(toString(Frequency::Monthly), "MONTHLY");
	EXPECT_STREQ(toString(Frequency::Once), "ONCE");
}

class ScheduleManagerTest : public ::testing::Test {
protected:
	AppConfig cfg;
	StrictMock<MockTaskScheduler> scheduler;

	void SetUp() override {
		const fs::path base = fs::temp_directory_path();
		cfg.selfExe = base / "jellyfin-backup";
		cfg.dataDir = base / "jellyfin-data";
		cfg.backupDir = base / "nas" / "jellyfin";
		cfg.toolDir = base / "7zip";
		cfg.toolUrl = "https://mirror.example/7z.tar.xz";
		cfg.serviceName = "jellyfin-custom";
	}
};

TEST_F(ScheduleManagerTest, InvalidCodeLeavesSchedulerUntouched) {
	ScheduleManager m(cfg, scheduler);

	const ScheduleResult r = m.schedule("q");

	EXPECT_EQ(r.status, ScheduleStatus::InvalidFrequency);
	EXPECT_FALSE(r.frequency.has_value());
	EXPECT_FALSE(r.error.empty());
}

TEST_F(ScheduleManagerTest, ReplacesExistingTask) {
	ScheduleManager m(cfg, scheduler);
	{
		::testing::InSequence seq;
		EXPECT_CALL(scheduler, remove("JellyfinBackup", _)).WillOnce(Return(true));
		EXPECT_CALL(scheduler, create(AllOf(
			Field(&ScheduledTask::name, "JellyfinBackup"),
			Field(&ScheduledTask::frequency, Frequency::Weekly),
			Field(&ScheduledTask::exe, cfg.selfExe),
			Field(&ScheduledTask::args, ElementsAre(
				"--backup-only",
				"--data-dir=" + cfg.dataDir.string(),
				"--backup-dir=" + cfg.backupDir.string(),
				"--tool-dir=" + cfg.toolDir.string(),
				"--tool-url=https://mirror.example/7z.tar.xz",
				"--service-name=jellyfin-custom")),
			Field(&ScheduledTask::hour, 3),
			Field(&ScheduledTask::minute, 0),
			Field(&ScheduledTask::highestPrivileges, true)), _))
			.WillOnce(Return(true));
	}

	const ScheduleResult r = m.schedule("w");

	ASSERT_TRUE(r.ok()) << r.error;
	ASSERT_TRUE(r.frequency.has_value());
	EXPECT_EQ(*r.frequency, Frequency::Weekly);
}

TEST_F(ScheduleManagerTest, EveryCodeRegistersMatchingFrequency) {
	ScheduleManager m(cfg, scheduler);
	EXPECT_CALL(scheduler, remove(_, _)).Times(4).WillRepeatedly(Return(true));

	const std::pair<const char*, Frequency> cases[] = {
		{ "d", Frequency::Daily }, { "w", Frequency::Weekly }, { "m", Frequency::Monthly }, { "y", Frequency::Once }
	};
	for (const auto& [code, expected] : cases)
	{
		EXPECT_CALL(scheduler, create(Field(&ScheduledTask::frequency, expected), _)).WillOnce(Return(true));
		EXPECT_TRUE(m.schedule(code).ok()) << code;
	}
}

TEST_F(ScheduleManagerTest, RemoveFailureDoesNotBlockRegistration) {
	ScheduleManager m(cfg, scheduler);
	EXPECT_CALL(scheduler, remove("JellyfinBackup", _))
		.WillOnce(Invoke([](const std::string&, std::string* error) {
			*error = "access denied";
			return false;
		}));
	EXPECT_CALL(scheduler, create(_, _)).WillOnce(Return(true));

	EXPECT_TRUE(m.schedule("d").ok());
}

TEST_F(ScheduleManagerTest, RegistrationFailure) {
	ScheduleManager m(cfg, scheduler);
	EXPECT_CALL(scheduler, remove(_, _)).WillOnce(Return(true));
	EXPECT_CALL(scheduler, create(_, _))
		.WillOnce(Invoke([](const ScheduledTask&, std::string* error) {
			*error = "schtasks /Create: exitCode=1";
			return false;
		}));

	const ScheduleResult r = m.schedule("m");

	EXPECT_EQ(r.status, ScheduleStatus::RegistrationFailed);
	EXPECT_EQ(r.error, "schtasks /Create: exitCode=1");
}

TEST_F(ScheduleManagerTest, ScheduledRunReusesResolvedConfiguration) {
	cfg.settleDelay = std::chrono::milliseconds(0);
	cfg.taskUser = "alice";
	ScheduleManager m(cfg, scheduler);

	const ScheduledTask t = m.taskFor(Frequency::Daily);

	//---Планировщик запускает программу в другом окружении: каталог данных
	//	передаётся явно, а не ищется заново
	EXPECT_THAT(t.args, ::testing::Contains("--data-dir=" + cfg.dataDir.string()));
	EXPECT_THAT(t.args, ::testing::Contains("--backup-dir=" + cfg.backupDir.string()));
	EXPECT_THAT(t.args, ::testing::Contains("--service-name=jellyfin-custom"));
	EXPECT_EQ(t.args.back(), "--no-delay");
	EXPECT_EQ(t.user, "alice");

	//---Аргументы разбираются обратно в ту же конфигурацию
	std::vector<std::string> args = t.args;
	args.insert(args.begin(), cfg.selfExe.string());
	std::vector<char*> argv;
	for (auto& a : args) argv.push_back(a.data());
	const CliOptions opt = parseCli(static_cast<int>(argv.size()), argv.data());
	EXPECT_EQ(opt.cmd, Command::BackupOnly);
	EXPECT_EQ(fs::path(opt.dataDir), cfg.dataDir);
	EXPECT_EQ(fs::path(opt.backupDir), cfg.backupDir);
	EXPECT_EQ(fs::path(opt.toolDir), cfg.toolDir);
	EXPECT_EQ(opt.toolUrl, cfg.toolUrl);
	EXPECT_EQ(opt.serviceName, "jellyfin-custom");
	EXPECT_TRUE(opt.noDelay);
}

TEST_F(ScheduleManagerTest, EmptyValuesAreNotPassed) {
	AppConfig bare;
	bare.selfExe = cfg.selfExe;
	ScheduleManager m(bare, scheduler);

	const ScheduledTask t = m.taskFor(Frequency::Weekly);

	EXPECT_THAT(t.args, ElementsAre("--backup-only"));
	EXPECT_TRUE(t.user.empty());
}
