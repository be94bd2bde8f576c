#include "OrphanGear/MatchEngine.h"

#include "OrphanGear/TextUtil.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace OrphanGear
{
	namespace
	{
		[[nodiscard]] bool NameMatches(const Reference& a_reference, const std::string& a_nameKey, const std::string& a_logNameKey)
		{
			return a_reference.NameKey() == a_nameKey || (!a_logNameKey.empty() && a_reference.NameKey() == a_logNameKey);
		}
	}

	bool IsCovered(const InventoryEntry& a_entry, const ReferenceSet& a_references)
	{
		const auto nameKey = detail::ToLowerAsciiCopy(a_entry.name);
		const auto logNameKey = detail::ToLowerAsciiCopy(a_entry.logName);
		const auto entryAugments = a_entry.NormalizedAugments();

		for (const auto& reference : a_references) {
			if (!NameMatches(reference, nameKey, logNameKey)) {
				continue;
			}
			if (!reference.HasAugments()) {
				return true;
			}
			if (IsAugmentSubset(reference.NormalizedAugments(), entryAugments)) {
				return true;
			}
		}
		return false;
	}

	ReferenceIndex::ReferenceIndex(const ReferenceSet& a_references)
	{
		for (const auto& reference : a_references) {
			auto& bucket = _byName[reference.NameKey()];
			if (!reference.HasAugments()) {
				bucket.push_back(Candidate{ .unconditional = true, .augments = {} });
			} else {
				bucket.push_back(Candidate{ .unconditional = false, .augments = reference.NormalizedAugments() });
			}
		}
	}

	bool ReferenceIndex::BucketCovers(const std::string& a_nameKey, const NormalizedAugmentSet& a_entryAugments) const
	{
		const auto it = _byName.find(a_nameKey);
		if (it == _byName.end()) {
			return false;
		}
		return std::any_of(it->second.begin(), it->second.end(), [&](const Candidate& a_candidate) {
			return a_candidate.unconditional || IsAugmentSubset(a_candidate.augments, a_entryAugments);
		});
	}

	bool ReferenceIndex::Covers(const InventoryEntry& a_entry) const
	{
		const auto entryAugments = a_entry.NormalizedAugments();
		if (BucketCovers(detail::ToLowerAsciiCopy(a_entry.name), entryAugments)) {
			return true;
		}
		return !a_entry.logName.empty() && BucketCovers(detail::ToLowerAsciiCopy(a_entry.logName), entryAugments);
	}

	std::vector<InventoryEntry> FindOrphans(
		const std::vector<InventoryEntry>& a_entries,
		const ReferenceSet& a_references)
	{
		const ReferenceIndex index(a_references);

		std::vector<InventoryEntry> orphans;
		for (const auto& entry : a_entries) {
			if (!index.Covers(entry)) {
				orphans.push_back(entry);
			}
		}
		return orphans;
	}

	ComparisonResult RunComparison(
		const std::vector<InventoryEntry>& a_entries,
		const ScriptExtraction& a_extraction)
	{
		ComparisonResult result{};
		result.orphans = FindOrphans(a_entries, a_extraction.references);

		for (const auto& source : a_extraction.sources) {
			if (source.status == ScriptReadStatus::kRead) {
				result.scriptSources.push_back(source.path);
			} else {
				result.failedSources.push_back(source.path);
			}
		}

		result.summary = ComparisonSummary{
			.referenceCount = a_extraction.references.size(),
			.augmentedReferenceCount = static_cast<std::size_t>(std::count_if(
				a_extraction.references.begin(),
				a_extraction.references.end(),
				[](const Reference& a_reference) { return a_reference.HasAugments(); })),
			.entryCount = a_entries.size(),
			.augmentedEntryCount = static_cast<std::size_t>(std::count_if(
				a_entries.begin(),
				a_entries.end(),
				[](const InventoryEntry& a_entry) { return a_entry.HasAugments(); })),
			.orphanCount = result.orphans.size()
		};

		spdlog::info(
			"OrphanGear: {} references ({} with augments) from {} script(s), {} failed; {} entries considered, {} orphaned",
			result.summary.referenceCount,
			result.summary.augmentedReferenceCount,
			result.scriptSources.size(),
			result.failedSources.size(),
			result.summary.entryCount,
			result.summary.orphanCount);

		return result;
	}
}
