#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "Strategy.hpp"

namespace jfbak {

	namespace fs = std::filesystem;

	class ICommandRunner;
	class IDownloader;

	//---Способ распаковки скачанного дистрибутива внешней утилитой
	struct ExtractStrategy final {
		std::string name;		//	Для журнала ("tar", "Expand-Archive", ...)
		fs::path exe;			//	Если файла нет → стратегия не применима
		std::function<std::vector<std::string>(const fs::path& archive, const fs::path& outDir)> args;
	};

	//---Откуда и куда получать архиватор
	struct ToolSource final {
		fs::path toolDir;						//	Куда кладётся исполняемый файл
		std::string url;						//	Переносимый дистрибутив
		std::vector<std::string> exeNames;		//	Допустимые имена, сначала самый функциональный
		std::vector<ExtractStrategy> strategies;
		fs::path tempRoot;						//	Пусто → системный temp
	};

	//---Гарантирует наличие исполняемого файла архиватора
	class IToolProvisioner {
	public:
		virtual ~IToolProvisioner() = default;

		//---false - архиватор получить не удалось (ошибка в *error)
		virtual bool ensureTool(fs::path& tool, std::string* error) = 0;
	};

	class ArchiveToolProvisioner final : public IToolProvisioner {
	public:
		ArchiveToolProvisioner(ToolSource source, IDownloader& downloader, ICommandRunner& runner);

		bool ensureTool(fs::path& tool, std::string* error) override;

		//---Уже установленный архиватор или пустой путь
		fs::path findInstalled() const;

	private:
		StrategyOutcome tryExtract(const ExtractStrategy& s, const fs::path& archive, const fs::path& outDir);
		bool extract(const fs::path& archive, const fs::path& outDir, std::string* error);
		fs::path findInTree(const fs::path& root) const;

		ToolSource source_;
		IDownloader& downloader_;
		ICommandRunner& runner_;
	};

	//---Источник по умолчанию для текущей платформы
	ToolSource defaultToolSource(const fs::path& toolDir, const std::string& url, const std::vector<std::string>& exeNames);

};//---namespace jfbak
