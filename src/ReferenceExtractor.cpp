#include "OrphanGear/ReferenceExtractor.h"

#include "OrphanGear/ItemNameFilter.h"
#include "OrphanGear/TextUtil.h"

#include <optional>

namespace OrphanGear
{
	namespace
	{
		inline constexpr std::string_view kNameField = "name";
		inline constexpr std::string_view kAugmentsField = "augments";

		[[nodiscard]] bool IsKind(std::span<const ScriptToken> a_tokens, std::size_t a_index, ScriptTokenKind a_kind) noexcept
		{
			return a_index < a_tokens.size() && a_tokens[a_index].kind == a_kind;
		}

		[[nodiscard]] bool IsKeyword(std::span<const ScriptToken> a_tokens, std::size_t a_index, std::string_view a_keyword) noexcept
		{
			return IsKind(a_tokens, a_index, ScriptTokenKind::kIdentifier) &&
			       detail::EqualsCaseInsensitiveAscii(a_tokens[a_index].text, a_keyword);
		}

		struct AugmentedBlockMatch
		{
			std::size_t nameToken{ 0 };
			std::size_t listOpen{ 0 };
			std::size_t listClose{ 0 };
			std::size_t blockClose{ 0 };
		};

		[[nodiscard]] std::optional<AugmentedBlockMatch> TryMatchAugmentedBlock(
			std::span<const ScriptToken> a_tokens,
			std::size_t a_open)
		{
			if (!IsKind(a_tokens, a_open, ScriptTokenKind::kOpenBrace) ||
				!IsKeyword(a_tokens, a_open + 1, kNameField) ||
				!IsKind(a_tokens, a_open + 2, ScriptTokenKind::kAssign) ||
				!IsKind(a_tokens, a_open + 3, ScriptTokenKind::kString) ||
				!IsKind(a_tokens, a_open + 4, ScriptTokenKind::kComma) ||
				!IsKeyword(a_tokens, a_open + 5, kAugmentsField) ||
				!IsKind(a_tokens, a_open + 6, ScriptTokenKind::kAssign) ||
				!IsKind(a_tokens, a_open + 7, ScriptTokenKind::kOpenBrace)) {
				return std::nullopt;
			}

			std::size_t close = a_open + 8;
			while (close < a_tokens.size() && a_tokens[close].kind != ScriptTokenKind::kCloseBrace) {
				if (a_tokens[close].kind == ScriptTokenKind::kOpenBrace) {
					return std::nullopt;
				}
				++close;
			}
			if (!IsKind(a_tokens, close, ScriptTokenKind::kCloseBrace) ||
				!IsKind(a_tokens, close + 1, ScriptTokenKind::kCloseBrace)) {
				return std::nullopt;
			}

			return AugmentedBlockMatch{
				.nameToken = a_open + 3,
				.listOpen = a_open + 7,
				.listClose = close,
				.blockClose = close + 1
			};
		}
	}

	void MatchAugmentedBlocks(std::string_view a_text, std::span<const ScriptToken> a_tokens, ReferenceSet& a_out)
	{
		std::size_t i = 0;
		while (i < a_tokens.size()) {
			const auto match = TryMatchAugmentedBlock(a_tokens, i);
			if (!match) {
				++i;
				continue;
			}

			const auto name = detail::Trim(a_tokens[match->nameToken].value);
			if (detail::IsValidItemName(name)) {
				const auto listBegin = a_tokens[match->listOpen].offset + 1;
				const auto listEnd = a_tokens[match->listClose].offset;
				const auto augments = detail::Trim(a_text.substr(listBegin, listEnd - listBegin));
				a_out.emplace(std::string(name), std::string(augments));
			}
			i = match->blockClose + 1;
		}
	}

	void MatchSimpleAssignments(std::span<const ScriptToken> a_tokens, ReferenceSet& a_out)
	{
		for (std::size_t i = 0; i + 2 < a_tokens.size(); ++i) {
			if (a_tokens[i].kind != ScriptTokenKind::kIdentifier ||
				a_tokens[i + 1].kind != ScriptTokenKind::kAssign ||
				a_tokens[i + 2].kind != ScriptTokenKind::kString) {
				continue;
			}
			if (detail::EqualsCaseInsensitiveAscii(a_tokens[i].text, kNameField)) {
				continue;
			}

			const auto name = detail::Trim(a_tokens[i + 2].value);
			if (detail::IsValidItemName(name)) {
				a_out.emplace(std::string(name), std::string());
			}
		}
	}

	ReferenceSet ExtractReferences(std::string_view a_text)
	{
		ReferenceSet references;
		const auto tokens = TokenizeScript(a_text);
		MatchAugmentedBlocks(a_text, tokens, references);
		MatchSimpleAssignments(tokens, references);
		return references;
	}

	ReferenceSet ExtractReferences(const std::vector<std::string>& a_texts)
	{
		ReferenceSet references;
		for (const auto& text : a_texts) {
			references.merge(ExtractReferences(text));
		}
		return references;
	}
}
