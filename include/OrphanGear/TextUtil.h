#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace OrphanGear::detail
{
	[[nodiscard]] constexpr char ToLowerAscii(char a_char) noexcept
	{
		return (a_char >= 'A' && a_char <= 'Z') ? static_cast<char>(a_char + ('a' - 'A')) : a_char;
	}

	[[nodiscard]] constexpr bool IsSpaceAscii(char a_char) noexcept
	{
		return a_char == ' ' || a_char == '\t' || a_char == '\r' || a_char == '\n' || a_char == '\v' || a_char == '\f';
	}

	[[nodiscard]] constexpr bool IsDigitAscii(char a_char) noexcept
	{
		return a_char >= '0' && a_char <= '9';
	}

	[[nodiscard]] constexpr bool IsQuoteChar(char a_char) noexcept
	{
		return a_char == '"' || a_char == '\'';
	}

	[[nodiscard]] constexpr std::string_view Trim(std::string_view a_text) noexcept
	{
		while (!a_text.empty() && IsSpaceAscii(a_text.front())) {
			a_text.remove_prefix(1);
		}
		while (!a_text.empty() && IsSpaceAscii(a_text.back())) {
			a_text.remove_suffix(1);
		}
		return a_text;
	}

	[[nodiscard]] constexpr bool EqualsCaseInsensitiveAscii(std::string_view a_lhs, std::string_view a_rhs) noexcept
	{
		if (a_lhs.size() != a_rhs.size()) {
			return false;
		}
		for (std::size_t i = 0; i < a_lhs.size(); ++i) {
			if (ToLowerAscii(a_lhs[i]) != ToLowerAscii(a_rhs[i])) {
				return false;
			}
		}
		return true;
	}

	template <class TokenRange>
	[[nodiscard]] constexpr bool MatchesAnyCaseInsensitive(std::string_view a_text, const TokenRange& a_tokens) noexcept
	{
		for (const auto& rawToken : a_tokens) {
			if (EqualsCaseInsensitiveAscii(a_text, std::string_view{ rawToken })) {
				return true;
			}
		}
		return false;
	}

	// Non-ASCII bytes pass through untouched, so UTF-8 names keep their encoding.
	[[nodiscard]] inline std::string ToLowerAsciiCopy(std::string_view a_text)
	{
		std::string out(a_text);
		for (auto& c : out) {
			c = ToLowerAscii(c);
		}
		return out;
	}
}
