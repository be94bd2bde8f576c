#pragma once

#include <string>
#include <string_view>

namespace OrphanGear
{
	inline constexpr std::string_view kUtf8ReplacementCharacter = "\xEF\xBF\xBD";
	inline constexpr std::string_view kUtf8ByteOrderMark = "\xEF\xBB\xBF";

	[[nodiscard]] bool IsValidUtf8(std::string_view a_bytes) noexcept;

	// Each maximal ill-formed subsequence becomes one U+FFFD; valid text is copied unchanged.
	[[nodiscard]] std::string DecodeUtf8Lossy(std::string_view a_bytes);

	[[nodiscard]] std::string_view StripUtf8ByteOrderMark(std::string_view a_text) noexcept;
}
