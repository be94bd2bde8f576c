#pragma once

#include "OrphanGear/Reference.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace OrphanGear
{
	inline constexpr std::string_view kDefaultScriptExtension = ".lua";

	enum class ScriptReadStatus : std::uint8_t
	{
		kRead = 0,
		kUnreadable,
	};

	// Invalid UTF-8 is replaced, never fatal. kUnreadable means the file itself could not be read.
	[[nodiscard]] ScriptReadStatus ReadScriptSource(const std::filesystem::path& a_path, std::string& a_outText);

	// Files with the extension directly inside a directory, sorted; or the path itself if it is a file.
	[[nodiscard]] std::vector<std::filesystem::path> CollectScriptSources(
		const std::filesystem::path& a_path,
		std::string_view a_extension = kDefaultScriptExtension);

	struct ScriptSourceResult
	{
		std::filesystem::path path{};
		ScriptReadStatus status{ ScriptReadStatus::kRead };
		ReferenceSet references{};
	};

	struct ScriptExtraction
	{
		ReferenceSet references{};
		std::vector<ScriptSourceResult> sources{};
	};

	// Unreadable sources are logged and recorded, then skipped.
	[[nodiscard]] ScriptExtraction ExtractFromSources(const std::vector<std::filesystem::path>& a_paths);
}
