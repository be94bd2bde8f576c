#include "OrphanGear/ScriptScanner.h"

#include "OrphanGear/TextUtil.h"

#include <optional>
#include <utility>

namespace OrphanGear
{
	namespace
	{
		[[nodiscard]] constexpr bool IsIdentifierStart(char a_char) noexcept
		{
			return (a_char >= 'a' && a_char <= 'z') || (a_char >= 'A' && a_char <= 'Z') || a_char == '_';
		}

		[[nodiscard]] constexpr bool IsIdentifierPart(char a_char) noexcept
		{
			return IsIdentifierStart(a_char) || detail::IsDigitAscii(a_char);
		}

		[[nodiscard]] constexpr bool IsComparisonLead(char a_char) noexcept
		{
			return a_char == '=' || a_char == '~' || a_char == '<' || a_char == '>' || a_char == '!';
		}

		struct ScannedString
		{
			std::size_t end{ 0 };  // one past the closing quote
			std::string value{};
		};

		[[nodiscard]] std::optional<ScannedString> ScanQuotedString(std::string_view a_text, std::size_t a_begin)
		{
			const char quote = a_text[a_begin];
			ScannedString scanned{};

			std::size_t i = a_begin + 1;
			while (i < a_text.size()) {
				const char c = a_text[i];
				if (c == '\n' || c == '\r') {
					return std::nullopt;
				}
				if (c == quote) {
					scanned.end = i + 1;
					return scanned;
				}
				if (c == '\\' && i + 1 < a_text.size() && a_text[i + 1] != '\n' && a_text[i + 1] != '\r') {
					const char escaped = a_text[i + 1];
					if (escaped != '\\' && !detail::IsQuoteChar(escaped)) {
						scanned.value.push_back(c);
					}
					scanned.value.push_back(escaped);
					i += 2;
					continue;
				}
				scanned.value.push_back(c);
				++i;
			}
			return std::nullopt;
		}
	}

	std::vector<ScriptToken> TokenizeScript(std::string_view a_text)
	{
		std::vector<ScriptToken> tokens;

		auto emit = [&](ScriptTokenKind a_kind, std::size_t a_begin, std::size_t a_end) {
			tokens.push_back(ScriptToken{
				.kind = a_kind,
				.offset = a_begin,
				.text = a_text.substr(a_begin, a_end - a_begin),
				.value = {} });
		};

		std::size_t i = 0;
		while (i < a_text.size()) {
			const char c = a_text[i];

			if (detail::IsSpaceAscii(c)) {
				++i;
				continue;
			}

			if (IsIdentifierStart(c)) {
				std::size_t end = i + 1;
				while (end < a_text.size() && IsIdentifierPart(a_text[end])) {
					++end;
				}
				emit(ScriptTokenKind::kIdentifier, i, end);
				i = end;
				continue;
			}

			if (detail::IsQuoteChar(c)) {
				if (auto scanned = ScanQuotedString(a_text, i); scanned) {
					tokens.push_back(ScriptToken{
						.kind = ScriptTokenKind::kString,
						.offset = i,
						.text = a_text.substr(i, scanned->end - i),
						.value = std::move(scanned->value) });
					i = scanned->end;
				} else {
					emit(ScriptTokenKind::kOther, i, i + 1);
					++i;
				}
				continue;
			}

			// "==", "~=", "<=", ">=" are comparisons, never assignments.
			if (IsComparisonLead(c) && i + 1 < a_text.size() && a_text[i + 1] == '=') {
				emit(ScriptTokenKind::kOther, i, i + 2);
				i += 2;
				continue;
			}

			switch (c) {
			case '=':
				emit(ScriptTokenKind::kAssign, i, i + 1);
				break;
			case ',':
				emit(ScriptTokenKind::kComma, i, i + 1);
				break;
			case '{':
				emit(ScriptTokenKind::kOpenBrace, i, i + 1);
				break;
			case '}':
				emit(ScriptTokenKind::kCloseBrace, i, i + 1);
				break;
			default:
				emit(ScriptTokenKind::kOther, i, i + 1);
				break;
			}
			++i;
		}

		return tokens;
	}
}
