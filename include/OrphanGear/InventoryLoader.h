#pragma once

#include "OrphanGear/ContainerSet.h"
#include "OrphanGear/InventoryEntry.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace OrphanGear
{
	inline constexpr std::string_view kColumnItemId = "item_id";
	inline constexpr std::string_view kColumnItemName = "item_name";
	inline constexpr std::string_view kColumnContainerId = "container_id";
	inline constexpr std::string_view kColumnContainerName = "container_name";
	inline constexpr std::string_view kColumnAugments = "augments";
	inline constexpr std::string_view kColumnCount = "count";
	inline constexpr std::string_view kColumnItemNameLog = "item_name_log";

	enum class InventoryLoadStatus : std::uint8_t
	{
		kLoaded = 0,
		kUnreadable,
		kMalformed,
	};

	struct InventoryLoadError
	{
		InventoryLoadStatus status{ InventoryLoadStatus::kLoaded };
		std::size_t line{ 0 };  // 0 when the failure is not tied to a line
		std::string message{};
	};

	struct InventoryLoadOptions
	{
		ContainerSet containers{ MakeDefaultEquippableContainers() };
		bool equippableOnly{ true };
	};

	// Any failure aborts the whole load and leaves a_outEntries empty: a partial inventory would
	// under-report orphans. Rows outside the container set are dropped after validation.
	[[nodiscard]] InventoryLoadStatus LoadInventory(
		std::string_view a_csvText,
		const InventoryLoadOptions& a_options,
		std::vector<InventoryEntry>& a_outEntries,
		InventoryLoadError* a_outError = nullptr);

	[[nodiscard]] InventoryLoadStatus LoadInventory(
		std::string_view a_csvText,
		std::vector<InventoryEntry>& a_outEntries,
		InventoryLoadError* a_outError = nullptr);

	[[nodiscard]] InventoryLoadStatus LoadInventoryFile(
		const std::filesystem::path& a_path,
		const InventoryLoadOptions& a_options,
		std::vector<InventoryEntry>& a_outEntries,
		InventoryLoadError* a_outError = nullptr);
}
