#include "OrphanGear/AugmentNormalizer.h"

#include "OrphanGear/TextUtil.h"

#include <algorithm>
#include <string>
#include <vector>

namespace OrphanGear
{
	namespace
	{
		[[nodiscard]] std::string_view StripOuterBraces(std::string_view a_text) noexcept
		{
			if (a_text.size() >= 2 && a_text.front() == '{' && a_text.back() == '}') {
				a_text.remove_prefix(1);
				a_text.remove_suffix(1);
			}
			return a_text;
		}

		[[nodiscard]] std::vector<std::string_view> SplitSemicolonSegments(std::string_view a_text)
		{
			std::vector<std::string_view> segments;
			std::size_t segmentStart = 0;
			for (auto pos = a_text.find(';'); pos != std::string_view::npos; pos = a_text.find(';', segmentStart)) {
				segments.push_back(a_text.substr(segmentStart, pos - segmentStart));
				segmentStart = pos + 1;
			}
			segments.push_back(a_text.substr(segmentStart));
			return segments;
		}

		[[nodiscard]] std::vector<std::string_view> SplitCommaSegments(std::string_view a_text)
		{
			std::vector<std::string_view> segments;
			std::size_t segmentStart = 0;
			char quote = '\0';

			for (std::size_t i = 0; i < a_text.size(); ++i) {
				const char c = a_text[i];
				if (quote == '\0') {
					if (detail::IsQuoteChar(c)) {
						quote = c;
					} else if (c == ',') {
						segments.push_back(a_text.substr(segmentStart, i - segmentStart));
						segmentStart = i + 1;
					}
				} else if (c == quote) {
					quote = '\0';
				}
			}
			segments.push_back(a_text.substr(segmentStart));
			return segments;
		}

		// Every surrounding quote goes, so '"Fast Cast"+10' and "Fast Cast"+10 agree.
		[[nodiscard]] std::string CleanSegment(std::string_view a_segment)
		{
			auto text = detail::Trim(a_segment);
			while (!text.empty() && detail::IsQuoteChar(text.front())) {
				text.remove_prefix(1);
			}
			while (!text.empty() && detail::IsQuoteChar(text.back())) {
				text.remove_suffix(1);
			}

			std::string cleaned;
			cleaned.reserve(text.size());
			for (std::size_t i = 0; i < text.size(); ++i) {
				cleaned.push_back(text[i]);
				if (text[i] == '"' && i + 1 < text.size() && text[i + 1] == '"') {
					++i;
				}
			}
			return cleaned;
		}
	}

	NormalizedAugmentSet NormalizeAugments(std::string_view a_raw)
	{
		NormalizedAugmentSet normalized;

		const auto text = StripOuterBraces(detail::Trim(a_raw));
		if (text.empty()) {
			return normalized;
		}

		const auto segments = (text.find(';') != std::string_view::npos) ?
			SplitSemicolonSegments(text) :
			SplitCommaSegments(text);

		for (const auto segment : segments) {
			auto augment = CleanSegment(segment);
			if (augment.empty() || augment.starts_with(kSystemAugmentPrefix)) {
				continue;
			}
			normalized.insert(detail::ToLowerAsciiCopy(augment));
		}

		return normalized;
	}

	std::string SerializeAugments(const NormalizedAugmentSet& a_augments)
	{
		if (a_augments.empty()) {
			return {};
		}

		std::string out{ "{" };
		for (const auto& augment : a_augments) {
			if (out.size() > 1) {
				out.push_back(',');
			}
			out.push_back('"');
			for (const char c : augment) {
				if (c == '"') {
					out.push_back('"');
				}
				out.push_back(c);
			}
			out.push_back('"');
		}
		out.push_back('}');
		return out;
	}

	bool IsAugmentSubset(const NormalizedAugmentSet& a_required, const NormalizedAugmentSet& a_available)
	{
		return std::includes(a_available.begin(), a_available.end(), a_required.begin(), a_required.end());
	}
}
