#include "orphan_gear_checks_common.h"

namespace OrphanGearChecks
{
	bool CheckScriptTokenizer()
	{
		using OrphanGear::ScriptTokenKind;

		const std::string_view text = R"(sets.idle = { main="Aeneas", sub='Genbu\'s Shield' } if x == "y" then)";
		const auto tokens = OrphanGear::TokenizeScript(text);

		std::vector<ScriptTokenKind> kinds;
		for (const auto& token : tokens) {
			kinds.push_back(token.kind);
		}

		const std::vector<ScriptTokenKind> expected{
			ScriptTokenKind::kIdentifier,  // sets
			ScriptTokenKind::kOther,       // .
			ScriptTokenKind::kIdentifier,  // idle
			ScriptTokenKind::kAssign,
			ScriptTokenKind::kOpenBrace,
			ScriptTokenKind::kIdentifier,  // main
			ScriptTokenKind::kAssign,
			ScriptTokenKind::kString,
			ScriptTokenKind::kComma,
			ScriptTokenKind::kIdentifier,  // sub
			ScriptTokenKind::kAssign,
			ScriptTokenKind::kString,
			ScriptTokenKind::kCloseBrace,
			ScriptTokenKind::kIdentifier,  // if
			ScriptTokenKind::kIdentifier,  // x
			ScriptTokenKind::kOther,       // ==
			ScriptTokenKind::kString,
			ScriptTokenKind::kIdentifier,  // then
		};
		if (kinds != expected) {
			std::cerr << "script_tokenizer: unexpected token kinds (" << kinds.size() << " tokens)\n";
			return false;
		}

		if (tokens[7].value != "Aeneas" || tokens[7].text != "\"Aeneas\"" || tokens[7].offset != 19) {
			std::cerr << "script_tokenizer: string token must carry value, raw text and offset\n";
			return false;
		}
		if (tokens[11].value != "Genbu's Shield") {
			std::cerr << "script_tokenizer: escaped quotes must be unescaped in the value\n";
			return false;
		}
		if (tokens[15].text != "==") {
			std::cerr << "script_tokenizer: '==' must be a single comparison token\n";
			return false;
		}

		// An apostrophe in a comment must not swallow the following lines.
		const auto commented = OrphanGear::TokenizeScript("-- don't forget\nhead=\"Nyame Helm\"\n");
		bool foundHelm = false;
		for (const auto& token : commented) {
			if (token.kind == ScriptTokenKind::kString && token.value == "Nyame Helm") {
				foundHelm = true;
			}
		}
		if (!foundHelm) {
			std::cerr << "script_tokenizer: an unterminated quote must end at the line break\n";
			return false;
		}

		return true;
	}

	bool CheckAugmentedBlockRule()
	{
		const std::string_view text =
			"back={ name=\"Rosmerta's Cape\", augments={'DEX+20','Accuracy+20 Attack+20','\"Dbl.Atk.\"+10',} }\n"
			"body = { NAME = 'Herculean Vest' , AUGMENTS = { \"Path: A\" } }\n"
			"legs={ name=\"Nested\", augments={ {'x'} } }\n"
			"feet={ name=\"Extra\", augments={'HP+20'}, priority=2 }\n";
		const auto tokens = OrphanGear::TokenizeScript(text);

		OrphanGear::ReferenceSet references;
		OrphanGear::MatchAugmentedBlocks(text, tokens, references);

		if (references.size() != 2) {
			std::cerr << "augmented_rule: expected exactly two augmented references, got " << references.size() << "\n";
			return false;
		}
		if (!ContainsReference(references, "Rosmerta's Cape", R"('DEX+20','Accuracy+20 Attack+20','"Dbl.Atk."+10',)")) {
			std::cerr << "augmented_rule: raw augment text must be kept verbatim between the braces\n";
			return false;
		}
		if (!ContainsReference(references, "herculean vest", "\"Path: A\"")) {
			std::cerr << "augmented_rule: field keywords must match case-insensitively\n";
			return false;
		}

		// The script quotes the whole augment; the inventory export writes it bare.
		const auto cape = MakeEntry("Rosmerta's Cape", "DEX+20; Accuracy+20 Attack+20; \"Dbl.Atk.\"+10; STR+5");
		if (!OrphanGear::IsCovered(cape, references)) {
			std::cerr << "augmented_rule: a quoted script augment must cover the bare inventory augment\n";
			return false;
		}
		const auto otherCape = MakeEntry("Rosmerta's Cape", "DEX+20; Accuracy+20 Attack+20; STR+5");
		if (OrphanGear::IsCovered(otherCape, references)) {
			std::cerr << "augmented_rule: a copy missing one extracted augment must stay uncovered\n";
			return false;
		}

		return true;
	}

	bool CheckSimpleAssignmentRule()
	{
		const std::string_view text =
			"sets.engaged = {\n"
			"    main=\"Naegling\", sub='Blurred Shield +1',\n"
			"    ammo=\"Coiste Bodhar\",\n"
			"}\n"
			"gear.default.weaponskill_waist = \"Fotia Belt\"\n"
			"state.OffenseMode = \"Normal\"\n"
			"state.HybridMode = 'DT'\n"
			"send_command('bind ^` input /ja \"Provoke\" <t>')\n"
			"lockstyleset = \"12\"\n"
			"ring_slot = \"left_ring\"\n"
			"macro = \"select_default_macro_book()\"\n"
			"extra = { name=\"Odd Name\" }\n"
			"if player.main_job == \"WAR\" then end\n"
			"local x = \"  Spaced Name  \"\n";
		const auto tokens = OrphanGear::TokenizeScript(text);

		OrphanGear::ReferenceSet references;
		OrphanGear::MatchSimpleAssignments(tokens, references);

		const std::vector<std::string_view> expected{
			"Naegling",
			"Blurred Shield +1",
			"Coiste Bodhar",
			"Fotia Belt",
			"Spaced Name",
		};
		for (const auto name : expected) {
			if (!ContainsReference(references, name, "")) {
				std::cerr << "simple_rule: missing reference " << name << "\n";
				return false;
			}
		}
		if (references.size() != expected.size()) {
			std::cerr << "simple_rule: expected " << expected.size() << " references, got " << references.size() << "\n";
			return false;
		}

		return true;
	}

	bool CheckReferenceDeduplication()
	{
		const std::vector<std::string> texts{
			"main=\"Aeneas\"\nsub={ name=\"Genbu's Shield\", augments={\"Path: A\"} }\n",
			"main=\"AENEAS\"\nsub={ name=\"Genbu's Shield\", augments={'Path: A'} }\nrange='Aeneas'\n",
		};
		const auto references = OrphanGear::ExtractReferences(texts);

		// Aeneas folds by case; the two augment spellings stay distinct.
		if (references.size() != 3) {
			std::cerr << "dedup: expected 3 distinct references, got " << references.size() << "\n";
			return false;
		}
		if (!ContainsReference(references, "aeneas", "") ||
			!ContainsReference(references, "Genbu's Shield", "\"Path: A\"") ||
			!ContainsReference(references, "Genbu's Shield", "'Path: A'")) {
			std::cerr << "dedup: reference identity must be (lower-cased name, raw augment text)\n";
			return false;
		}

		const auto single = OrphanGear::ExtractReferences(texts.front());
		if (single.size() != 2) {
			std::cerr << "dedup: augmented and simple rules must both apply to one text\n";
			return false;
		}

		if (!OrphanGear::ExtractReferences("-- nothing to see here\nlocal n = 5\n").empty()) {
			std::cerr << "dedup: text without patterns must yield no references\n";
			return false;
		}

		return true;
	}

	bool CheckLossyScriptDecoding()
	{
		const std::string bytes = "main=\"Caladbolg\"\xFF\xFE\nhead=\"Ca\xC3\xB1on\"\nbad=\"x\xE2\x82\"\n";
		if (OrphanGear::IsValidUtf8(bytes)) {
			std::cerr << "lossy_decode: sample must contain invalid UTF-8\n";
			return false;
		}

		const auto decoded = OrphanGear::DecodeUtf8Lossy(bytes);
		const std::string expected =
			"main=\"Caladbolg\"\xEF\xBF\xBD\xEF\xBF\xBD\nhead=\"Ca\xC3\xB1on\"\nbad=\"x\xEF\xBF\xBD\"\n";
		if (decoded != expected || !OrphanGear::IsValidUtf8(decoded)) {
			std::cerr << "lossy_decode: invalid sequences must become U+FFFD and valid ones must survive\n";
			return false;
		}

		const auto dir = MakeScratchDirectory("lossy_decode");
		const auto path = dir / "broken.lua";
		if (!WriteFile(path, "\xEF\xBB\xBF" + bytes)) {
			std::cerr << "lossy_decode: failed to write fixture\n";
			return false;
		}

		std::string text;
		if (OrphanGear::ReadScriptSource(path, text) != OrphanGear::ScriptReadStatus::kRead || text != expected) {
			std::cerr << "lossy_decode: undecodable bytes must not make a script unreadable\n";
			return false;
		}

		const auto references = OrphanGear::ExtractReferences(text);
		if (!ContainsReference(references, "Caladbolg", "") || !ContainsReference(references, "Ca\xC3\xB1on", "")) {
			std::cerr << "lossy_decode: references around invalid bytes must still be extracted\n";
			return false;
		}

		return true;
	}

	bool CheckBatchExtractionSkipsUnreadable()
	{
		const auto dir = MakeScratchDirectory("batch_extraction");
		if (!WriteFile(dir / "WAR.lua", "main=\"Naegling\"\n") ||
			!WriteFile(dir / "BLU.LUA", "sub={ name=\"Thibron\", augments={'TP Bonus +1000'} }\n") ||
			!WriteFile(dir / "empty.lua", "-- no gear\n") ||
			!WriteFile(dir / "notes.txt", "main=\"Not A Script\"\n")) {
			std::cerr << "batch_extraction: failed to write fixtures\n";
			return false;
		}

		auto sources = OrphanGear::CollectScriptSources(dir);
		if (sources.size() != 3 || sources[0].filename() != "BLU.LUA" || sources[2].filename() != "empty.lua") {
			std::cerr << "batch_extraction: expected the three .lua files in sorted order\n";
			return false;
		}

		const auto single = OrphanGear::CollectScriptSources(dir / "notes.txt");
		if (single.size() != 1 || single.front() != dir / "notes.txt") {
			std::cerr << "batch_extraction: a file path must be used as-is\n";
			return false;
		}

		sources.push_back(dir / "missing.lua");
		const auto extraction = OrphanGear::ExtractFromSources(sources);

		if (extraction.sources.size() != 4) {
			std::cerr << "batch_extraction: every source must be reported\n";
			return false;
		}
		if (extraction.sources[3].status != OrphanGear::ScriptReadStatus::kUnreadable) {
			std::cerr << "batch_extraction: missing file must be reported unreadable\n";
			return false;
		}
		if (extraction.sources[2].status != OrphanGear::ScriptReadStatus::kRead || !extraction.sources[2].references.empty()) {
			std::cerr << "batch_extraction: a script without gear is read successfully with zero references\n";
			return false;
		}
		if (extraction.references.size() != 2 ||
			!ContainsReference(extraction.references, "Naegling", "") ||
			!ContainsReference(extraction.references, "Thibron", "'TP Bonus +1000'")) {
			std::cerr << "batch_extraction: readable sources must still be merged\n";
			return false;
		}

		return true;
	}
}
