#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace OrphanGear
{
	struct CsvRecord
	{
		std::size_t line{ 0 };  // 1-based line the record starts on
		std::vector<std::string> fields{};
	};

	enum class CsvParseStatus : std::uint8_t
	{
		kParsed = 0,
		kUnterminatedQuote,
	};

	// RFC 4180 records: quoted fields may hold commas, line breaks and doubled quotes.
	// Blank lines produce no record. On failure a_outErrorLine names the line of the open quote.
	[[nodiscard]] CsvParseStatus ParseCsvRecords(
		std::string_view a_text,
		std::vector<CsvRecord>& a_outRecords,
		std::size_t* a_outErrorLine = nullptr);
}
