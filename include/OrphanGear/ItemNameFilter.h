#pragma once

#include "OrphanGear/TextUtil.h"

#include <array>
#include <string_view>

namespace OrphanGear::detail
{
	// Values scripts assign to mode and state variables rather than to gear slots.
	inline constexpr std::array<std::string_view, 17> kNonItemTokens{
		"none",
		"empty",
		"true",
		"false",
		"nil",
		"normal",
		"acc",
		"dt",
		"pdt",
		"mdt",
		"idle",
		"engaged",
		"defense",
		"offense",
		"physical",
		"magical",
		"hybrid"
	};

	inline constexpr std::array<std::string_view, 20> kEquipmentSlotNames{
		"main",
		"sub",
		"range",
		"ammo",
		"head",
		"neck",
		"ear1",
		"ear2",
		"left_ear",
		"right_ear",
		"body",
		"hands",
		"ring1",
		"ring2",
		"left_ring",
		"right_ring",
		"back",
		"waist",
		"legs",
		"feet"
	};

	[[nodiscard]] constexpr bool IsAllDigitsAscii(std::string_view a_text) noexcept
	{
		if (a_text.empty()) {
			return false;
		}
		for (const char c : a_text) {
			if (!IsDigitAscii(c)) {
				return false;
			}
		}
		return true;
	}

	// The simple assignment rule matches any `key = "value"`, so this rejects values that
	// are plainly not item names.
	[[nodiscard]] constexpr bool IsValidItemName(std::string_view a_name) noexcept
	{
		if (a_name.size() < 2) {
			return false;
		}
		if (MatchesAnyCaseInsensitive(a_name, kNonItemTokens)) {
			return false;
		}
		if (a_name.find('(') != std::string_view::npos || a_name.find(')') != std::string_view::npos) {
			return false;
		}
		if (IsAllDigitsAscii(a_name)) {
			return false;
		}
		if (MatchesAnyCaseInsensitive(a_name, kEquipmentSlotNames)) {
			return false;
		}
		return true;
	}
}
