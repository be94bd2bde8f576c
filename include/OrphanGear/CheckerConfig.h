#pragma once

#include "OrphanGear/ContainerSet.h"
#include "OrphanGear/ScriptSources.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace OrphanGear
{
	inline constexpr std::string_view kConfigFieldEquippableContainers = "equippableContainers";
	inline constexpr std::string_view kConfigFieldEquippableOnly = "equippableOnly";
	inline constexpr std::string_view kConfigFieldScriptExtension = "scriptExtension";
	inline constexpr std::string_view kConfigFieldLogLevel = "logLevel";
	inline constexpr std::string_view kConfigFieldLogFile = "logFile";

	struct CheckerConfig
	{
		ContainerSet equippableContainers{ MakeDefaultEquippableContainers() };
		bool equippableOnly{ true };
		std::string scriptExtension{ kDefaultScriptExtension };
		std::string logLevel{ "info" };
		std::string logFile{};
	};

	enum class ConfigLoadStatus : std::uint8_t
	{
		kLoaded = 0,
		kMissing,
		kIoError,
		kParseError,
	};

	// Unknown keys are ignored; a key with an unusable value is logged and keeps its default.
	void ApplyConfigOverrides(const nlohmann::json& a_root, CheckerConfig& a_config);

	[[nodiscard]] ConfigLoadStatus LoadCheckerConfig(const std::filesystem::path& a_path, CheckerConfig& a_outConfig);
}
