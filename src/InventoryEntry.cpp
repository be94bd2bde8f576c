#include "OrphanGear/InventoryEntry.h"

namespace OrphanGear
{
	std::string InventoryEntry::DisplayName() const
	{
		if (augmentText.empty()) {
			return name;
		}

		std::string display = name;
		display += " [";
		if (augmentText.size() > kDisplayAugmentMaxLength) {
			display.append(augmentText, 0, kDisplayAugmentMaxLength);
			display += "...";
		} else {
			display += augmentText;
		}
		display += "]";
		return display;
	}
}
