#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include "OrphanGear/CheckerConfig.h"
#include "OrphanGear/InventoryLoader.h"
#include "OrphanGear/MatchEngine.h"
#include "OrphanGear/OrphanDocument.h"
#include "OrphanGear/ScriptSources.h"

namespace
{
	enum ExitCode : int
	{
		kExitOk = 0,
		kExitUsage = 1,
		kExitConfig = 2,
		kExitInventory = 3,
		kExitOutput = 4,
	};

	struct CommandLine
	{
		std::filesystem::path scriptPath{};
		std::filesystem::path inventoryPath{};
		std::optional<std::filesystem::path> configPath{};
		std::optional<std::filesystem::path> jsonOutPath{};
		bool allContainers{ false };
		bool verbose{ false };
	};

	void PrintUsage()
	{
		std::cerr << "Usage: orphan_gear <lua_folder_or_file> <inventory_csv> [options]\n"
		             "\n"
		             "Options:\n"
		             "  --config <path>     JSON configuration file\n"
		             "  --all-containers    compare every container, not only the wardrobes\n"
		             "  --json-out <path>   write the orphan list as JSON\n"
		             "  --verbose           debug logging\n";
	}

	[[nodiscard]] std::optional<CommandLine> ParseCommandLine(int a_argc, char** a_argv)
	{
		CommandLine commandLine{};
		std::vector<std::string_view> positional;

		for (int i = 1; i < a_argc; ++i) {
			const std::string_view arg{ a_argv[i] };
			if (arg == "--config" || arg == "--json-out") {
				if (i + 1 >= a_argc) {
					std::cerr << "orphan_gear: " << arg << " needs a value\n";
					return std::nullopt;
				}
				const std::filesystem::path value{ a_argv[++i] };
				if (arg == "--config") {
					commandLine.configPath = value;
				} else {
					commandLine.jsonOutPath = value;
				}
			} else if (arg == "--all-containers") {
				commandLine.allContainers = true;
			} else if (arg == "--verbose") {
				commandLine.verbose = true;
			} else if (arg.starts_with("--")) {
				std::cerr << "orphan_gear: unknown option " << arg << "\n";
				return std::nullopt;
			} else {
				positional.push_back(arg);
			}
		}

		if (positional.size() != 2) {
			return std::nullopt;
		}
		commandLine.scriptPath = std::filesystem::path(positional[0]);
		commandLine.inventoryPath = std::filesystem::path(positional[1]);
		return commandLine;
	}

	void SetupLogging(const OrphanGear::CheckerConfig& a_config, bool a_verbose)
	{
		std::vector<spdlog::sink_ptr> sinks;
		sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
		if (!a_config.logFile.empty()) {
			try {
				sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(a_config.logFile, true));
			} catch (const spdlog::spdlog_ex& e) {
				std::cerr << "orphan_gear: cannot open log file " << a_config.logFile << " (" << e.what() << ")\n";
			}
		}

		auto logger = std::make_shared<spdlog::logger>("", sinks.begin(), sinks.end());
		spdlog::set_default_logger(std::move(logger));
		spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

		auto level = spdlog::level::from_str(a_config.logLevel);
		if (level == spdlog::level::off && a_config.logLevel != "off") {
			level = spdlog::level::info;
		}
		spdlog::set_level(a_verbose ? spdlog::level::debug : level);
		spdlog::flush_on(spdlog::level::warn);
	}
}

int main(int argc, char** argv)
{
	const auto commandLine = ParseCommandLine(argc, argv);
	if (!commandLine) {
		PrintUsage();
		return kExitUsage;
	}

	OrphanGear::CheckerConfig config{};
	if (commandLine->configPath) {
		if (OrphanGear::LoadCheckerConfig(*commandLine->configPath, config) != OrphanGear::ConfigLoadStatus::kLoaded) {
			std::cerr << "orphan_gear: cannot use config file " << commandLine->configPath->string() << "\n";
			return kExitConfig;
		}
	}
	SetupLogging(config, commandLine->verbose);

	const auto scriptSources = OrphanGear::CollectScriptSources(commandLine->scriptPath, config.scriptExtension);
	if (scriptSources.empty()) {
		spdlog::warn("OrphanGear: no {} files found under {}", config.scriptExtension, commandLine->scriptPath.string());
	}
	const auto extraction = OrphanGear::ExtractFromSources(scriptSources);

	OrphanGear::InventoryLoadOptions loadOptions{
		.containers = config.equippableContainers,
		.equippableOnly = config.equippableOnly && !commandLine->allContainers
	};
	std::vector<OrphanGear::InventoryEntry> entries;
	OrphanGear::InventoryLoadError loadError{};
	if (OrphanGear::LoadInventoryFile(commandLine->inventoryPath, loadOptions, entries, &loadError) != OrphanGear::InventoryLoadStatus::kLoaded) {
		std::cerr << "orphan_gear: cannot load inventory " << commandLine->inventoryPath.string();
		if (loadError.line != 0) {
			std::cerr << " (line " << loadError.line << ")";
		}
		std::cerr << ": " << loadError.message << "\n";
		return kExitInventory;
	}

	const auto result = OrphanGear::RunComparison(entries, extraction);
	for (const auto& orphan : result.orphans) {
		std::cout << orphan.containerName << '\t' << orphan.DisplayName() << '\n';
	}

	if (commandLine->jsonOutPath) {
		const auto document = OrphanGear::BuildOrphanDocument(result, commandLine->inventoryPath);
		if (!OrphanGear::SaveOrphanDocument(*commandLine->jsonOutPath, document)) {
			return kExitOutput;
		}
		spdlog::info("OrphanGear: orphan list saved to {}", commandLine->jsonOutPath->string());
	}

	return kExitOk;
}
