#include "OrphanGear/Reference.h"

#include "OrphanGear/TextUtil.h"

namespace OrphanGear
{
	Reference::Reference(std::string a_name, std::string a_augmentText) :
		_name(std::move(a_name)),
		_nameKey(detail::ToLowerAsciiCopy(_name)),
		_augmentText(std::move(a_augmentText))
	{}
}
