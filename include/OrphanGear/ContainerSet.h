#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace OrphanGear
{
	// Container id -> label. Passed into the loader so tests can swap the set freely.
	struct ContainerSet
	{
		std::map<std::int64_t, std::string> containers{};

		[[nodiscard]] bool Contains(std::int64_t a_containerId) const
		{
			return containers.find(a_containerId) != containers.end();
		}

		[[nodiscard]] bool empty() const noexcept { return containers.empty(); }
		[[nodiscard]] std::size_t size() const noexcept { return containers.size(); }
	};

	// The eight wardrobes. The main bag is left out because it mostly holds consumables.
	[[nodiscard]] inline ContainerSet MakeDefaultEquippableContainers()
	{
		return ContainerSet{
			.containers = {
				{ 8, "wardrobe" },
				{ 10, "wardrobe2" },
				{ 11, "wardrobe3" },
				{ 12, "wardrobe4" },
				{ 13, "wardrobe5" },
				{ 14, "wardrobe6" },
				{ 15, "wardrobe7" },
				{ 16, "wardrobe8" },
			}
		};
	}
}
