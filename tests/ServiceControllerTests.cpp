#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <system_error>

#include "Mocks.hpp"
#include "jellyfin_backup/ServiceController.hpp"

using namespace jfbak;
using namespace jfbak::test;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgReferee;
using ::testing::StrictMock;


class ServiceControllerTest : public ::testing::Test {
protected:
	fs::path testDir = fs::temp_directory_path() / "jfbak_service_test";

	StrictMock<MockServiceBackend> backend;
	StrictMock<MockProcessControl> processes;
	ServiceTarget target;

	void SetUp() override {
		fs::remove_all(testDir);
		fs::create_directories(testDir);

		target.serviceName = "jellyfin";
		target.processName = "jellyfin";
		target.userExe = testDir / "missing" / "jellyfin";
		target.stopTimeout = std::chrono::milliseconds(2000);
		target.pollInterval = std::chrono::milliseconds(1);
		target.settleDelay = std::chrono::milliseconds(0);
	}

	void TearDown() override {
		std::error_code ec;
		fs::remove_all(testDir, ec);
	}

	void serviceRegistered(bool registered) {
		EXPECT_CALL(backend, exists("jellyfin", _, _))
			.WillRepeatedly(DoAll(SetArgReferee<1>(registered), Return(true)));
	}
};

TEST_F(ServiceControllerTest, StopsRegisteredService) {
	ServiceController c(target, backend, processes);
	serviceRegistered(true);
	EXPECT_CALL(backend, stop("jellyfin", _)).WillOnce(Return(true));
	EXPECT_CALL(processes, isRunning("jellyfin")).WillRepeatedly(Return(false));

	EXPECT_EQ(c.stop(), StopOutcome::Stopped);
}

TEST_F(ServiceControllerTest, WaitsUntilProcessExits) {
	ServiceController c(target, backend, processes);
	serviceRegistered(true);
	EXPECT_CALL(backend, stop("jellyfin", _)).WillOnce(Return(true));
	EXPECT_CALL(processes, isRunning("jellyfin"))
		.WillOnce(Return(true))
		.WillOnce(Return(true))
		.WillOnce(Return(false));

	EXPECT_EQ(c.stop(), StopOutcome::Stopped);
}

TEST_F(ServiceControllerTest, KillsProcessWhenNoServiceIsRegistered) {
	ServiceController c(target, backend, processes);
	serviceRegistered(false);
	EXPECT_CALL(processes, isRunning("jellyfin"))
		.WillOnce(Return(true))
		.WillRepeatedly(Return(false));
	EXPECT_CALL(processes, killAll("jellyfin", _)).WillOnce(Return(true));

	EXPECT_EQ(c.stop(), StopOutcome::Stopped);
}

TEST_F(ServiceControllerTest, ServiceQueryErrorFallsBackToProcess) {
	ServiceController c(target, backend, processes);
	EXPECT_CALL(backend, exists("jellyfin", _, _)).WillOnce(Return(false));
	EXPECT_CALL(processes, isRunning("jellyfin")).WillOnce(Return(false));

	EXPECT_EQ(c.stop(), StopOutcome::NotRunning);
}

TEST_F(ServiceControllerTest, NothingToStop) {
	ServiceController c(target, backend, processes);
	serviceRegistered(false);
	EXPECT_CALL(processes, isRunning("jellyfin")).WillOnce(Return(false));

	EXPECT_EQ(c.stop(), StopOutcome::NotRunning);
}

TEST_F(ServiceControllerTest, ServiceStopFailureFallsBackToKill) {
	ServiceController c(target, backend, processes);
	serviceRegistered(true);
	EXPECT_CALL(backend, stop("jellyfin", _)).WillOnce(Return(false));
	EXPECT_CALL(processes, isRunning("jellyfin"))
		.WillOnce(Return(true))
		.WillRepeatedly(Return(false));
	EXPECT_CALL(processes, killAll("jellyfin", _)).WillOnce(Return(true));

	EXPECT_EQ(c.stop(), StopOutcome::Stopped);
}

TEST_F(ServiceControllerTest, StopFailsWhenNoStrategySucceeds) {
	ServiceController c(target, backend, processes);
	serviceRegistered(true);
	EXPECT_CALL(backend, stop("jellyfin", _)).WillOnce(Return(false));
	EXPECT_CALL(processes, isRunning("jellyfin")).WillOnce(Return(false));

	EXPECT_EQ(c.stop(), StopOutcome::StopFailed);
}

TEST_F(ServiceControllerTest, StartsRegisteredService) {
	ServiceController c(target, backend, processes);
	serviceRegistered(true);
	EXPECT_CALL(backend, start("jellyfin", _)).WillOnce(Return(true));

	EXPECT_EQ(c.start(), StartOutcome::Started);
}

TEST_F(ServiceControllerTest, LaunchesUserInstallation) {
	target.userExe = testDir / "jellyfin";
	writeFile(target.userExe, "");
	ServiceController c(target, backend, processes);
	serviceRegistered(false);
	EXPECT_CALL(processes, launchDetached(target.userExe, _)).WillOnce(Return(true));

	EXPECT_EQ(c.start(), StartOutcome::Launched);
}

TEST_F(ServiceControllerTest, ManualStartWhenNothingIsInstalled) {
	ServiceController c(target, backend, processes);
	serviceRegistered(false);

	EXPECT_EQ(c.start(), StartOutcome::ManualStartRequired);
}

TEST_F(ServiceControllerTest, StartFailureIsReported) {
	ServiceController c(target, backend, processes);
	serviceRegistered(true);
	EXPECT_CALL(backend, start("jellyfin", _)).WillOnce(Return(false));

	EXPECT_EQ(c.start(), StartOutcome::StartFailed);
}

TEST_F(ServiceControllerTest, LaunchFailureIsReported) {
	target.userExe = testDir / "jellyfin";
	writeFile(target.userExe, "");
	ServiceController c(target, backend, processes);
	serviceRegistered(false);
	EXPECT_CALL(processes, launchDetached(target.userExe, _)).WillOnce(Return(false));

	EXPECT_EQ(c.start(), StartOutcome::StartFailed);
}
