#pragma once

#include "OrphanGear/AugmentNormalizer.h"
#include "OrphanGear/InventoryEntry.h"
#include "OrphanGear/Reference.h"
#include "OrphanGear/ScriptSources.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace OrphanGear
{
	// A reference without augments covers every copy of the item. A reference with augments
	// covers only copies whose augment set contains all of them (literal strings).
	[[nodiscard]] bool IsCovered(const InventoryEntry& a_entry, const ReferenceSet& a_references);

	// References bucketed by lower-cased name with augment sets normalized once.
	class ReferenceIndex
	{
	public:
		explicit ReferenceIndex(const ReferenceSet& a_references);

		[[nodiscard]] bool Covers(const InventoryEntry& a_entry) const;

	private:
		struct Candidate
		{
			bool unconditional{ false };
			NormalizedAugmentSet augments{};
		};

		[[nodiscard]] bool BucketCovers(const std::string& a_nameKey, const NormalizedAugmentSet& a_entryAugments) const;

		std::unordered_map<std::string, std::vector<Candidate>> _byName;
	};

	// Keeps input order.
	[[nodiscard]] std::vector<InventoryEntry> FindOrphans(
		const std::vector<InventoryEntry>& a_entries,
		const ReferenceSet& a_references);

	struct ComparisonSummary
	{
		std::size_t referenceCount{ 0 };
		std::size_t augmentedReferenceCount{ 0 };
		std::size_t entryCount{ 0 };
		std::size_t augmentedEntryCount{ 0 };
		std::size_t orphanCount{ 0 };
	};

	struct ComparisonResult
	{
		std::vector<InventoryEntry> orphans{};
		std::vector<std::filesystem::path> scriptSources{};
		std::vector<std::filesystem::path> failedSources{};
		ComparisonSummary summary{};
	};

	[[nodiscard]] ComparisonResult RunComparison(
		const std::vector<InventoryEntry>& a_entries,
		const ScriptExtraction& a_extraction);
}
