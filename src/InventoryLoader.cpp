#include "OrphanGear/InventoryLoader.h"

#include "OrphanGear/CsvReader.h"
#include "OrphanGear/TextUtil.h"
#include "OrphanGear/Utf8.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace OrphanGear
{
	namespace
	{
		struct ColumnLayout
		{
			std::size_t itemId{ 0 };
			std::size_t itemName{ 0 };
			std::size_t containerId{ 0 };
			std::size_t containerName{ 0 };
			std::optional<std::size_t> augments{};
			std::optional<std::size_t> count{};
			std::optional<std::size_t> itemNameLog{};
			std::size_t requiredWidth{ 0 };
		};

		[[nodiscard]] std::optional<std::size_t> FindColumn(const std::vector<std::string>& a_header, std::string_view a_name)
		{
			for (std::size_t i = 0; i < a_header.size(); ++i) {
				if (detail::Trim(a_header[i]) == a_name) {
					return i;
				}
			}
			return std::nullopt;
		}

		[[nodiscard]] std::optional<std::int64_t> ParseInteger(std::string_view a_text) noexcept
		{
			auto text = detail::Trim(a_text);
			if (!text.empty() && text.front() == '+') {
				text.remove_prefix(1);
			}
			if (text.empty()) {
				return std::nullopt;
			}

			std::int64_t value = 0;
			const auto* end = text.data() + text.size();
			const auto result = std::from_chars(text.data(), end, value, 10);
			if (result.ec != std::errc{} || result.ptr != end) {
				return std::nullopt;
			}
			return value;
		}

		[[nodiscard]] std::string_view CellOrEmpty(const CsvRecord& a_record, const std::optional<std::size_t>& a_column)
		{
			if (!a_column || *a_column >= a_record.fields.size()) {
				return {};
			}
			return a_record.fields[*a_column];
		}

		InventoryLoadStatus Fail(
			InventoryLoadStatus a_status,
			std::size_t a_line,
			std::string a_message,
			std::vector<InventoryEntry>& a_outEntries,
			InventoryLoadError* a_outError)
		{
			a_outEntries.clear();
			if (a_line != 0) {
				spdlog::warn("OrphanGear: inventory load failed at line {}: {}", a_line, a_message);
			} else {
				spdlog::warn("OrphanGear: inventory load failed: {}", a_message);
			}
			if (a_outError) {
				*a_outError = InventoryLoadError{
					.status = a_status,
					.line = a_line,
					.message = std::move(a_message)
				};
			}
			return a_status;
		}

		[[nodiscard]] bool BuildColumnLayout(const std::vector<std::string>& a_header, ColumnLayout& a_outLayout, std::string& a_outMissing)
		{
			const std::array<std::pair<std::string_view, std::size_t*>, 4> required{ {
				{ kColumnItemId, &a_outLayout.itemId },
				{ kColumnItemName, &a_outLayout.itemName },
				{ kColumnContainerId, &a_outLayout.containerId },
				{ kColumnContainerName, &a_outLayout.containerName },
			} };

			for (const auto& [column, slot] : required) {
				const auto index = FindColumn(a_header, column);
				if (!index) {
					a_outMissing = std::string(column);
					return false;
				}
				*slot = *index;
				a_outLayout.requiredWidth = std::max(a_outLayout.requiredWidth, *index + 1);
			}

			a_outLayout.augments = FindColumn(a_header, kColumnAugments);
			a_outLayout.count = FindColumn(a_header, kColumnCount);
			a_outLayout.itemNameLog = FindColumn(a_header, kColumnItemNameLog);
			return true;
		}
	}

	InventoryLoadStatus LoadInventory(
		std::string_view a_csvText,
		const InventoryLoadOptions& a_options,
		std::vector<InventoryEntry>& a_outEntries,
		InventoryLoadError* a_outError)
	{
		a_outEntries.clear();

		if (!IsValidUtf8(a_csvText)) {
			return Fail(InventoryLoadStatus::kUnreadable, 0, "inventory is not valid UTF-8", a_outEntries, a_outError);
		}

		std::vector<CsvRecord> records;
		std::size_t errorLine = 0;
		if (ParseCsvRecords(StripUtf8ByteOrderMark(a_csvText), records, &errorLine) != CsvParseStatus::kParsed) {
			return Fail(InventoryLoadStatus::kMalformed, errorLine, "unterminated quoted field", a_outEntries, a_outError);
		}
		if (records.empty()) {
			return Fail(InventoryLoadStatus::kMalformed, 0, "missing header row", a_outEntries, a_outError);
		}

		ColumnLayout layout{};
		std::string missingColumn;
		if (!BuildColumnLayout(records.front().fields, layout, missingColumn)) {
			return Fail(
				InventoryLoadStatus::kMalformed,
				records.front().line,
				"header is missing required column '" + missingColumn + "'",
				a_outEntries,
				a_outError);
		}

		std::vector<InventoryEntry> entries;
		entries.reserve(records.size() - 1);
		std::size_t filtered = 0;

		for (std::size_t r = 1; r < records.size(); ++r) {
			const auto& record = records[r];
			if (record.fields.size() < layout.requiredWidth) {
				return Fail(InventoryLoadStatus::kMalformed, record.line, "row is missing required fields", a_outEntries, a_outError);
			}

			const auto itemId = ParseInteger(record.fields[layout.itemId]);
			if (!itemId) {
				return Fail(
					InventoryLoadStatus::kMalformed,
					record.line,
					"item_id '" + record.fields[layout.itemId] + "' is not an integer",
					a_outEntries,
					a_outError);
			}

			const auto containerId = ParseInteger(record.fields[layout.containerId]);
			if (!containerId) {
				return Fail(
					InventoryLoadStatus::kMalformed,
					record.line,
					"container_id '" + record.fields[layout.containerId] + "' is not an integer",
					a_outEntries,
					a_outError);
			}

			std::int64_t count = 1;
			const auto countText = detail::Trim(CellOrEmpty(record, layout.count));
			if (!countText.empty()) {
				const auto parsedCount = ParseInteger(countText);
				if (!parsedCount || *parsedCount < 1) {
					return Fail(
						InventoryLoadStatus::kMalformed,
						record.line,
						"count '" + std::string(countText) + "' is not a positive integer",
						a_outEntries,
						a_outError);
				}
				count = *parsedCount;
			}

			if (record.fields[layout.itemName].empty()) {
				return Fail(InventoryLoadStatus::kMalformed, record.line, "item_name is empty", a_outEntries, a_outError);
			}

			if (a_options.equippableOnly && !a_options.containers.Contains(*containerId)) {
				++filtered;
				continue;
			}

			entries.push_back(InventoryEntry{
				.itemId = *itemId,
				.name = record.fields[layout.itemName],
				.logName = std::string(detail::Trim(CellOrEmpty(record, layout.itemNameLog))),
				.containerId = *containerId,
				.containerName = record.fields[layout.containerName],
				.augmentText = std::string(detail::Trim(CellOrEmpty(record, layout.augments))),
				.count = count });
		}

		spdlog::info(
			"OrphanGear: loaded {} inventory entries ({} outside the equippable containers skipped)",
			entries.size(),
			filtered);

		a_outEntries = std::move(entries);
		if (a_outError) {
			*a_outError = InventoryLoadError{};
		}
		return InventoryLoadStatus::kLoaded;
	}

	InventoryLoadStatus LoadInventory(
		std::string_view a_csvText,
		std::vector<InventoryEntry>& a_outEntries,
		InventoryLoadError* a_outError)
	{
		return LoadInventory(a_csvText, InventoryLoadOptions{}, a_outEntries, a_outError);
	}

	InventoryLoadStatus LoadInventoryFile(
		const std::filesystem::path& a_path,
		const InventoryLoadOptions& a_options,
		std::vector<InventoryEntry>& a_outEntries,
		InventoryLoadError* a_outError)
	{
		std::ifstream in(a_path, std::ios::binary);
		if (!in.is_open()) {
			return Fail(
				InventoryLoadStatus::kUnreadable,
				0,
				"failed to open " + a_path.string(),
				a_outEntries,
				a_outError);
		}

		const std::string bytes(
			(std::istreambuf_iterator<char>(in)),
			std::istreambuf_iterator<char>());
		if (in.bad()) {
			return Fail(
				InventoryLoadStatus::kUnreadable,
				0,
				"failed while reading " + a_path.string(),
				a_outEntries,
				a_outError);
		}

		return LoadInventory(bytes, a_options, a_outEntries, a_outError);
	}
}
