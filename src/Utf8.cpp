#include "OrphanGear/Utf8.h"

#include <cstddef>
#include <cstdint>

namespace OrphanGear
{
	namespace
	{
		struct SequenceShape
		{
			std::size_t length{ 0 };
			std::uint8_t secondMin{ 0x80 };
			std::uint8_t secondMax{ 0xBF };
		};

		[[nodiscard]] constexpr SequenceShape ShapeForLeadByte(std::uint8_t a_lead) noexcept
		{
			if (a_lead <= 0x7F) {
				return SequenceShape{ .length = 1 };
			}
			if (a_lead >= 0xC2 && a_lead <= 0xDF) {
				return SequenceShape{ .length = 2 };
			}
			if (a_lead == 0xE0) {
				return SequenceShape{ .length = 3, .secondMin = 0xA0 };
			}
			if (a_lead == 0xED) {
				return SequenceShape{ .length = 3, .secondMax = 0x9F };
			}
			if (a_lead >= 0xE1 && a_lead <= 0xEF) {
				return SequenceShape{ .length = 3 };
			}
			if (a_lead == 0xF0) {
				return SequenceShape{ .length = 4, .secondMin = 0x90 };
			}
			if (a_lead >= 0xF1 && a_lead <= 0xF3) {
				return SequenceShape{ .length = 4 };
			}
			if (a_lead == 0xF4) {
				return SequenceShape{ .length = 4, .secondMax = 0x8F };
			}
			return SequenceShape{ .length = 0 };
		}

		// Returns the number of bytes forming a valid sequence at a_pos, or 0 with a_outConsumed
		// set to the length of the maximal ill-formed prefix.
		[[nodiscard]] std::size_t MeasureSequence(std::string_view a_bytes, std::size_t a_pos, std::size_t& a_outConsumed) noexcept
		{
			const auto lead = static_cast<std::uint8_t>(a_bytes[a_pos]);
			const auto shape = ShapeForLeadByte(lead);
			if (shape.length == 0) {
				a_outConsumed = 1;
				return 0;
			}

			std::size_t consumed = 1;
			while (consumed < shape.length) {
				if (a_pos + consumed >= a_bytes.size()) {
					a_outConsumed = consumed;
					return 0;
				}
				const auto next = static_cast<std::uint8_t>(a_bytes[a_pos + consumed]);
				const std::uint8_t min = (consumed == 1) ? shape.secondMin : std::uint8_t{ 0x80 };
				const std::uint8_t max = (consumed == 1) ? shape.secondMax : std::uint8_t{ 0xBF };
				if (next < min || next > max) {
					a_outConsumed = consumed;
					return 0;
				}
				++consumed;
			}

			a_outConsumed = consumed;
			return consumed;
		}
	}

	bool IsValidUtf8(std::string_view a_bytes) noexcept
	{
		std::size_t pos = 0;
		while (pos < a_bytes.size()) {
			std::size_t consumed = 0;
			if (MeasureSequence(a_bytes, pos, consumed) == 0) {
				return false;
			}
			pos += consumed;
		}
		return true;
	}

	std::string DecodeUtf8Lossy(std::string_view a_bytes)
	{
		std::string out;
		out.reserve(a_bytes.size());

		std::size_t pos = 0;
		while (pos < a_bytes.size()) {
			std::size_t consumed = 0;
			if (MeasureSequence(a_bytes, pos, consumed) == 0) {
				out.append(kUtf8ReplacementCharacter);
			} else {
				out.append(a_bytes.substr(pos, consumed));
			}
			pos += consumed;
		}

		return out;
	}

	std::string_view StripUtf8ByteOrderMark(std::string_view a_text) noexcept
	{
		if (a_text.starts_with(kUtf8ByteOrderMark)) {
			a_text.remove_prefix(kUtf8ByteOrderMark.size());
		}
		return a_text;
	}
}
