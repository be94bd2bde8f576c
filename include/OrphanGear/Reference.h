#pragma once

#include "OrphanGear/AugmentNormalizer.h"

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_set>
#include <utility>

namespace OrphanGear
{
	// An item mention found in script text. Identity is the lower-cased name plus the raw
	// augment text, so two spellings of one augment list stay distinct references.
	class Reference
	{
	public:
		Reference(std::string a_name, std::string a_augmentText);

		[[nodiscard]] const std::string& Name() const noexcept { return _name; }
		[[nodiscard]] const std::string& NameKey() const noexcept { return _nameKey; }
		[[nodiscard]] const std::string& AugmentText() const noexcept { return _augmentText; }
		[[nodiscard]] bool HasAugments() const noexcept { return !_augmentText.empty(); }
		[[nodiscard]] NormalizedAugmentSet NormalizedAugments() const { return NormalizeAugments(_augmentText); }

		[[nodiscard]] bool operator==(const Reference& a_other) const noexcept
		{
			return _nameKey == a_other._nameKey && _augmentText == a_other._augmentText;
		}

	private:
		std::string _name;
		std::string _nameKey;
		std::string _augmentText;
	};

	struct ReferenceHash
	{
		[[nodiscard]] std::size_t operator()(const Reference& a_reference) const noexcept
		{
			const std::size_t left = std::hash<std::string>{}(a_reference.NameKey());
			const std::size_t right = std::hash<std::string>{}(a_reference.AugmentText());
			return left ^ (right + 0x9E3779B97F4A7C15ull + (left << 6) + (left >> 2));
		}
	};

	using ReferenceSet = std::unordered_set<Reference, ReferenceHash>;
}
