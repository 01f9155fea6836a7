#include "jellyfin_backup/BackupExecutor.hpp"
#include "jellyfin_backup/AppConfig.hpp"
#include "jellyfin_backup/ArchiveToolProvisioner.hpp"
#include "jellyfin_backup/Archiver.hpp"
#include "jellyfin_backup/CommandRunner.hpp"

#include <system_error>
#include <glog/logging.h>

namespace jfbak {

	const char* toString(BackupStatus s) {
		switch (s)
		{
		case BackupStatus::Succeeded: return "succeeded";
		case BackupStatus::NoDestination: return "no destination selected";
		case BackupStatus::DestinationFailed: return "destination not available";
		case BackupStatus::AcquisitionFailed: return "archiver not available";
		case BackupStatus::ArchiveFailed: return "archive creation failed";
		}
		return "unknown";
	}

	BackupExecutor::BackupExecutor(const AppConfig& cfg, IServiceController& service, IToolProvisioner& tools,
		ICommandRunner& runner, Clock now)
		: cfg_(cfg), service_(service), tools_(tools), runner_(runner), now_(std::move(now))
	{
	}

	//------------------------------------------------------------
	//	Шаги 2-7: папка → имя → архиватор → архив
	//------------------------------------------------------------
	void BackupExecutor::archive(const DestinationChoice& choice, BackupResult& r)
	{
		//---Папка назначения
		fs::path dest = cfg_.backupDir;
		if (choice.kind == DestinationChoice::Kind::Custom)
		{
			if (choice.custom.empty())
			{
				r.status = BackupStatus::NoDestination;
				r.error = "Backup folder selection cancelled";
				return;
			}
			dest = choice.custom;
		}

		std::error_code ec;
		fs::create_directories(dest, ec);
		if (ec)
		{
			r.status = BackupStatus::DestinationFailed;
			r.error = "Failed to create " + dest.string() + ": " + ec.message();
			return;
		}

		r.archive = dest / archiver::archiveFileName(now_());

		//---Архиватор
		fs::path tool;
		std::string err;
		if (!tools_.ensureTool(tool, &err))
		{
			r.status = BackupStatus::AcquisitionFailed;
			r.error = err;
			return;
		}

		LOG(INFO) << "Creating " << r.archive << " from " << cfg_.dataDir;

		process::RunResult rr;
		const bool ok = runner_.run(tool, archiver::createArgs(r.archive, cfg_.dataDir), rr, process::RunOptions{ .hideWindow = true });
		if (!ok || !rr.started)
		{
			r.status = BackupStatus::ArchiveFailed;
			r.exitCode = rr.exitCode;
			r.error = "Failed to run " + tool.string() + ", sysError=" + std::to_string(rr.sysError);
			return;
		}
		if (rr.exitCode != 0)
		{
			r.status = BackupStatus::ArchiveFailed;
			r.exitCode = rr.exitCode;
			r.error = "Archiver failed, ExitCode=" + std::to_string(rr.exitCode);
			return;
		}

		r.status = BackupStatus::Succeeded;
	}

	//------------------------------------------------------------
	//	Оркестратор. Запуск сервера в конце безусловный
	//------------------------------------------------------------
	BackupResult BackupExecutor::run(const DestinationChoice& choice)
	{
		BackupResult r;

		r.stop = service_.stop();
		archive(choice, r);

		if (r.ok())
			LOG(INFO) << "Backup created: " << r.archive;
		else
			LOG(ERROR) << "Backup " << toString(r.status) << ": " << r.error;

		r.start = service_.start();
		return r;
	}

};//---namespace jfbak
