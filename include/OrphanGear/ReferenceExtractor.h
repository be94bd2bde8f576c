#pragma once

#include "OrphanGear/Reference.h"
#include "OrphanGear/ScriptScanner.h"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace OrphanGear
{
	// { name = "X", augments = { ... } }  ->  Reference("X", raw text between the augments braces)
	void MatchAugmentedBlocks(std::string_view a_text, std::span<const ScriptToken> a_tokens, ReferenceSet& a_out);

	// key = "X"  ->  Reference("X", ""), skipping `name = ...` which belongs to an augmented block.
	void MatchSimpleAssignments(std::span<const ScriptToken> a_tokens, ReferenceSet& a_out);

	[[nodiscard]] ReferenceSet ExtractReferences(std::string_view a_text);
	[[nodiscard]] ReferenceSet ExtractReferences(const std::vector<std::string>& a_texts);
}
