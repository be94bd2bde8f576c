#include "OrphanGear/CsvReader.h"

namespace OrphanGear
{
	CsvParseStatus ParseCsvRecords(std::string_view a_text, std::vector<CsvRecord>& a_outRecords, std::size_t* a_outErrorLine)
	{
		a_outRecords.clear();

		std::size_t line = 1;
		CsvRecord record{ .line = line, .fields = {} };
		std::string field;
		bool fieldStarted = false;
		bool inQuotes = false;
		std::size_t quoteLine = 0;

		auto endField = [&]() {
			record.fields.push_back(std::move(field));
			field.clear();
			fieldStarted = false;
		};

		auto endRecord = [&]() {
			const bool blank = record.fields.empty() && !fieldStarted && field.empty();
			if (!blank) {
				endField();
				a_outRecords.push_back(std::move(record));
			}
			record = CsvRecord{ .line = line, .fields = {} };
			field.clear();
			fieldStarted = false;
		};

		std::size_t i = 0;
		while (i < a_text.size()) {
			const char c = a_text[i];

			if (inQuotes) {
				if (c == '"') {
					if (i + 1 < a_text.size() && a_text[i + 1] == '"') {
						field.push_back('"');
						i += 2;
						continue;
					}
					inQuotes = false;
				} else {
					if (c == '\n') {
						++line;
					}
					field.push_back(c);
				}
				++i;
				continue;
			}

			switch (c) {
			case '"':
				if (!fieldStarted) {
					inQuotes = true;
					quoteLine = line;
					fieldStarted = true;
				} else {
					field.push_back(c);
				}
				break;
			case ',':
				endField();
				break;
			case '\r':
				if (i + 1 < a_text.size() && a_text[i + 1] == '\n') {
					++i;
				}
				++line;
				endRecord();
				break;
			case '\n':
				++line;
				endRecord();
				break;
			default:
				field.push_back(c);
				fieldStarted = true;
				break;
			}
			++i;
		}

		if (inQuotes) {
			if (a_outErrorLine) {
				*a_outErrorLine = quoteLine;
			}
			a_outRecords.clear();
			return CsvParseStatus::kUnterminatedQuote;
		}

		endRecord();
		return CsvParseStatus::kParsed;
	}
}
