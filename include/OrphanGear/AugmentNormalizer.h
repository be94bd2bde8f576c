#pragma once

#include <set>
#include <string>
#include <string_view>

namespace OrphanGear
{
	inline constexpr std::string_view kSystemAugmentPrefix = "System:";

	// Ordered so the canonical serialization is stable.
	using NormalizedAugmentSet = std::set<std::string>;

	// Accepts both the inventory export convention ("Accuracy+5; Store TP+3") and the
	// script convention ({"Accuracy+5","Store TP+3"}). Never fails: text that fits neither
	// degrades to fewer, longer tokens.
	[[nodiscard]] NormalizedAugmentSet NormalizeAugments(std::string_view a_raw);

	// Brace form {"a","b"}; NormalizeAugments reads it back to the same set.
	[[nodiscard]] std::string SerializeAugments(const NormalizedAugmentSet& a_augments);

	[[nodiscard]] bool IsAugmentSubset(const NormalizedAugmentSet& a_required, const NormalizedAugmentSet& a_available);
}
