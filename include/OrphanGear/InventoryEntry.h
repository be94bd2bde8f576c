#pragma once

#include "OrphanGear/AugmentNormalizer.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace OrphanGear
{
	inline constexpr std::size_t kDisplayAugmentMaxLength = 60;

	// One stack of an item in one container.
	struct InventoryEntry
	{
		std::int64_t itemId{ 0 };
		std::string name{};
		std::string logName{};  // full name from the game log, e.g. "Sacred Kindred's Crest" for "S. Kindred Crest"
		std::int64_t containerId{ 0 };
		std::string containerName{};
		std::string augmentText{};
		std::int64_t count{ 1 };

		[[nodiscard]] bool HasAugments() const noexcept { return !augmentText.empty(); }
		[[nodiscard]] NormalizedAugmentSet NormalizedAugments() const { return NormalizeAugments(augmentText); }

		// "Name [augments]", augment text cut at kDisplayAugmentMaxLength characters.
		[[nodiscard]] std::string DisplayName() const;

		[[nodiscard]] bool operator==(const InventoryEntry&) const = default;
	};
}
