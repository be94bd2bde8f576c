#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace OrphanGear
{
	enum class ScriptTokenKind : std::uint8_t
	{
		kIdentifier = 0,
		kAssign,
		kComma,
		kOpenBrace,
		kCloseBrace,
		kString,
		kOther,
	};

	struct ScriptToken
	{
		ScriptTokenKind kind{ ScriptTokenKind::kOther };
		std::size_t offset{ 0 };
		std::string_view text{};  // raw slice of the scanned text, quotes included for strings
		std::string value{};      // unescaped contents, strings only
	};

	// Single forward pass, no backtracking. Strings end at their matching unescaped quote and
	// never cross a line break; an unterminated quote is emitted as kOther and scanning resumes
	// right after it. Comments are not special, so commented-out assignments still tokenize.
	// Tokens view into a_text and must not outlive it.
	[[nodiscard]] std::vector<ScriptToken> TokenizeScript(std::string_view a_text);
}
