#pragma once

#include "OrphanGear/InventoryEntry.h"
#include "OrphanGear/MatchEngine.h"

#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace OrphanGear
{
	// "<container>:<item>:<token>" with token the hex FNV-1a of the raw augment text, "0" without augments.
	[[nodiscard]] std::string MakeOrphanKey(const InventoryEntry& a_entry);

	// The hand-off consumed by the checklist layer.
	[[nodiscard]] nlohmann::json BuildOrphanDocument(
		const ComparisonResult& a_result,
		const std::filesystem::path& a_inventoryFile);

	// Written to a sibling temp file first, then renamed over a_path.
	[[nodiscard]] bool SaveOrphanDocument(const std::filesystem::path& a_path, const nlohmann::json& a_document);
}
