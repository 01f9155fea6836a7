#include "jellyfin_backup/RestoreExecutor.hpp"
#include "jellyfin_backup/AppConfig.hpp"
#include "jellyfin_backup/ArchiveToolProvisioner.hpp"
#include "jellyfin_backup/Archiver.hpp"
#include "jellyfin_backup/CommandRunner.hpp"
#include "jellyfin_backup/Platform.hpp"

#include <system_error>
#include <glog/logging.h>

namespace jfbak {

	const char* toString(RestoreStatus s) {
		switch (s)
		{
		case RestoreStatus::Succeeded: return "succeeded";
		case RestoreStatus::Cancelled: return "cancelled";
		case RestoreStatus::ArchiveMissing: return "archive not found";
		case RestoreStatus::ClearFailed: return "data directory could not be cleared";
		case RestoreStatus::AcquisitionFailed: return "archiver not available";
		case RestoreStatus::ArchiveFailed: return "extraction failed";
		case RestoreStatus::OwnershipFailed: return "data directory owner could not be restored";
		}
		return "unknown";
	}

	RestoreExecutor::RestoreExecutor(const AppConfig& cfg, IServiceController& service, IToolProvisioner& tools,
		ICommandRunner& runner)
		: cfg_(cfg), service_(service), tools_(tools), runner_(runner)
	{
	}

	//------------------------------------------------------------
	//	Шаги 2-5: очистка → архиватор → распаковка → владелец
	//------------------------------------------------------------
	void RestoreExecutor::restore(const fs::path& archive, RestoreResult& r)
	{
		//---Архив не хранит владельцев: запоминаем владельца каталога до очистки
		const DirOwner owner = dataDirOwner(cfg_.dataDir);

		LOG(WARNING) << "Clearing data directory " << cfg_.dataDir;

		std::string err;
		if (!clearDataDir(cfg_.dataDir, &err))
		{
			r.status = RestoreStatus::ClearFailed;
			r.error = err;
			return;
		}

		fs::path tool;
		if (!tools_.ensureTool(tool, &err))
		{
			r.status = RestoreStatus::AcquisitionFailed;
			r.error = err;
			return;
		}

		LOG(INFO) << "Extracting " << archive << " into " << cfg_.dataDir;

		process::RunResult rr;
		const bool ok = runner_.run(tool, archiver::extractArgs(archive, cfg_.dataDir), rr, process::RunOptions{ .hideWindow = true });
		if (!ok || !rr.started)
		{
			r.status = RestoreStatus::ArchiveFailed;
			r.exitCode = rr.exitCode;
			r.error = "Failed to run " + tool.string() + ", sysError=" + std::to_string(rr.sysError);
			return;
		}
		if (rr.exitCode != 0)
		{
			r.status = RestoreStatus::ArchiveFailed;
			r.exitCode = rr.exitCode;
			r.error = "Archiver failed, ExitCode=" + std::to_string(rr.exitCode);
			return;
		}

		if (!restoreDataDirOwner(cfg_.dataDir, owner, &err))
		{
			r.status = RestoreStatus::OwnershipFailed;
			r.error = err;
			return;
		}
		if (owner.known)
			LOG(INFO) << "Data directory owner restored: " << owner.uid << ":" << owner.gid;

		r.status = RestoreStatus::Succeeded;
	}

	//------------------------------------------------------------
	//	Оркестратор
	//------------------------------------------------------------
	RestoreResult RestoreExecutor::run(const std::optional<fs::path>& archive)
	{
		RestoreResult r;

		//---Отмена выбора: без остановки сервера и без изменений на диске
		if (!archive || archive->empty())
		{
			r.status = RestoreStatus::Cancelled;
			LOG(INFO) << "Restore cancelled";
			return r;
		}

		std::error_code ec;
		if (!fs::is_regular_file(*archive, ec))
		{
			r.status = RestoreStatus::ArchiveMissing;
			r.error = "Backup archive not found: " + archive->string();
			LOG(ERROR) << r.error;
			return r;
		}

		r.serviceTouched = true;
		r.stop = service_.stop();
		restore(*archive, r);

		if (r.ok())
			LOG(INFO) << "Restore completed from " << *archive;
		else
			LOG(ERROR) << "Restore " << toString(r.status) << ": " << r.error;

		r.start = service_.start();
		return r;
	}

};//---namespace jfbak
