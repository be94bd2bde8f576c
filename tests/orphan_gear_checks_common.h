#pragma once

#include "OrphanGear/AugmentNormalizer.h"
#include "OrphanGear/CheckerConfig.h"
#include "OrphanGear/CsvReader.h"
#include "OrphanGear/InventoryLoader.h"
#include "OrphanGear/MatchEngine.h"
#include "OrphanGear/OrphanDocument.h"
#include "OrphanGear/Reference.h"
#include "OrphanGear/ReferenceExtractor.h"
#include "OrphanGear/ScriptScanner.h"
#include "OrphanGear/ScriptSources.h"
#include "OrphanGear/Utf8.h"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace OrphanGearChecks
{
	bool CheckDelimiterEquivalence();
	bool CheckSystemMarkerSuppression();
	bool CheckQuotedCommaHandling();
	bool CheckSurroundingQuoteEquivalence();
	bool CheckSemicolonSplitting();
	bool CheckNormalizationIdempotence();
	bool CheckAugmentSubset();

	bool CheckScriptTokenizer();
	bool CheckAugmentedBlockRule();
	bool CheckSimpleAssignmentRule();
	bool CheckReferenceDeduplication();
	bool CheckLossyScriptDecoding();
	bool CheckBatchExtractionSkipsUnreadable();

	bool CheckCsvRecords();
	bool CheckInventoryContainerFiltering();
	bool CheckInventoryOptionalColumns();
	bool CheckInventoryMalformedRows();

	bool CheckUnconditionalCoverage();
	bool CheckAugmentSubsetCoverage();
	bool CheckAlternateNameCoverage();
	bool CheckNonAsciiNameCoverage();
	bool CheckEndToEndScenario();
	bool CheckComparisonSummary();

	bool CheckConfigOverrides();
	bool CheckOrphanDocument();

	// Scratch directory under the system temp dir, removed and recreated on each call.
	[[nodiscard]] inline std::filesystem::path MakeScratchDirectory(std::string_view a_name)
	{
		const auto dir = std::filesystem::temp_directory_path() / "orphan_gear_checks" / std::string(a_name);
		std::error_code ec;
		std::filesystem::remove_all(dir, ec);
		std::filesystem::create_directories(dir, ec);
		return dir;
	}

	[[nodiscard]] inline bool WriteFile(const std::filesystem::path& a_path, std::string_view a_contents)
	{
		std::ofstream out(a_path, std::ios::binary | std::ios::trunc);
		if (!out.is_open()) {
			return false;
		}
		out.write(a_contents.data(), static_cast<std::streamsize>(a_contents.size()));
		return out.good();
	}

	[[nodiscard]] inline bool ContainsReference(
		const OrphanGear::ReferenceSet& a_references,
		std::string_view a_name,
		std::string_view a_augments)
	{
		return a_references.contains(OrphanGear::Reference(std::string(a_name), std::string(a_augments)));
	}

	[[nodiscard]] inline OrphanGear::InventoryEntry MakeEntry(
		std::string a_name,
		std::string a_augments,
		std::string a_logName = {},
		std::int64_t a_containerId = 8,
		std::string a_containerName = "wardrobe")
	{
		return OrphanGear::InventoryEntry{
			.itemId = 1,
			.name = std::move(a_name),
			.logName = std::move(a_logName),
			.containerId = a_containerId,
			.containerName = std::move(a_containerName),
			.augmentText = std::move(a_augments),
			.count = 1
		};
	}
}
