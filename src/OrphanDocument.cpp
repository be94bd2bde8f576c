#include "OrphanGear/OrphanDocument.h"

#include <cstdint>
#include <fstream>
#include <numeric>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace OrphanGear
{
	namespace
	{
		constexpr std::uint64_t kFnvOffsetBasis = 0xCBF29CE484222325ull;
		constexpr std::uint64_t kFnvPrime = 0x100000001B3ull;

		// FNV-1a over the raw augment bytes, so copies differing only in augments get distinct keys.
		[[nodiscard]] std::uint64_t HashAugmentText(std::string_view a_text) noexcept
		{
			return std::accumulate(a_text.begin(), a_text.end(), kFnvOffsetBasis, [](std::uint64_t a_hash, char a_byte) {
				return (a_hash ^ static_cast<unsigned char>(a_byte)) * kFnvPrime;
			});
		}

		[[nodiscard]] nlohmann::json PathNames(const std::vector<std::filesystem::path>& a_paths)
		{
			nlohmann::json names = nlohmann::json::array();
			for (const auto& path : a_paths) {
				names.push_back(path.filename().string());
			}
			return names;
		}
	}

	std::string MakeOrphanKey(const InventoryEntry& a_entry)
	{
		const std::string token = a_entry.HasAugments() ?
			fmt::format("{:016x}", HashAugmentText(a_entry.augmentText)) :
			std::string("0");
		return fmt::format("{}:{}:{}", a_entry.containerName, a_entry.name, token);
	}

	nlohmann::json BuildOrphanDocument(const ComparisonResult& a_result, const std::filesystem::path& a_inventoryFile)
	{
		nlohmann::json items = nlohmann::json::array();
		for (const auto& entry : a_result.orphans) {
			items.push_back({
				{ "key", MakeOrphanKey(entry) },
				{ "item_id", entry.itemId },
				{ "item_name", entry.name },
				{ "item_name_log", entry.logName },
				{ "container_id", entry.containerId },
				{ "container_name", entry.containerName },
				{ "augments", entry.augmentText },
				{ "count", entry.count },
			});
		}

		return nlohmann::json{
			{ "inventory_file", a_inventoryFile.filename().string() },
			{ "lua_files", PathNames(a_result.scriptSources) },
			{ "failed_files", PathNames(a_result.failedSources) },
			{ "summary",
				{
					{ "references", a_result.summary.referenceCount },
					{ "augmented_references", a_result.summary.augmentedReferenceCount },
					{ "inventory_items", a_result.summary.entryCount },
					{ "augmented_inventory_items", a_result.summary.augmentedEntryCount },
					{ "orphaned_items", a_result.summary.orphanCount },
				} },
			{ "items", std::move(items) },
		};
	}

	bool SaveOrphanDocument(const std::filesystem::path& a_path, const nlohmann::json& a_document)
	{
		std::error_code ec;
		if (a_path.has_parent_path()) {
			std::filesystem::create_directories(a_path.parent_path(), ec);
			if (ec) {
				spdlog::warn(
					"OrphanGear: failed to create output directory {} ({})",
					a_path.parent_path().string(),
					ec.message());
				return false;
			}
		}

		std::filesystem::path tempPath = a_path;
		tempPath += ".tmp";

		{
			std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
			if (!out.is_open()) {
				spdlog::warn("OrphanGear: failed to create temp output file {}", tempPath.string());
				return false;
			}
			out << a_document.dump(2) << '\n';
			out.flush();
			if (!out.good()) {
				spdlog::warn("OrphanGear: failed to write temp output file {}", tempPath.string());
				out.close();
				std::error_code removeEc;
				std::filesystem::remove(tempPath, removeEc);
				return false;
			}
		}

		std::filesystem::rename(tempPath, a_path, ec);
		if (ec) {
			spdlog::warn("OrphanGear: failed to replace output file {} ({})", a_path.string(), ec.message());
			std::error_code removeEc;
			std::filesystem::remove(tempPath, removeEc);
			return false;
		}

		return true;
	}
}
