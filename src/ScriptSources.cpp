#include "OrphanGear/ScriptSources.h"

#include "OrphanGear/ReferenceExtractor.h"
#include "OrphanGear/TextUtil.h"
#include "OrphanGear/Utf8.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

#include <spdlog/spdlog.h>

namespace OrphanGear
{
	ScriptReadStatus ReadScriptSource(const std::filesystem::path& a_path, std::string& a_outText)
	{
		a_outText.clear();

		std::ifstream in(a_path, std::ios::binary);
		if (!in.is_open()) {
			spdlog::warn("OrphanGear: failed to open script source {}", a_path.string());
			return ScriptReadStatus::kUnreadable;
		}

		const std::string bytes(
			(std::istreambuf_iterator<char>(in)),
			std::istreambuf_iterator<char>());
		if (in.bad()) {
			spdlog::warn("OrphanGear: failed while reading script source {}", a_path.string());
			return ScriptReadStatus::kUnreadable;
		}

		if (!IsValidUtf8(bytes)) {
			spdlog::debug("OrphanGear: replaced invalid UTF-8 in script source {}", a_path.string());
		}
		a_outText = DecodeUtf8Lossy(StripUtf8ByteOrderMark(bytes));
		return ScriptReadStatus::kRead;
	}

	std::vector<std::filesystem::path> CollectScriptSources(const std::filesystem::path& a_path, std::string_view a_extension)
	{
		std::vector<std::filesystem::path> sources;

		std::error_code ec;
		if (!std::filesystem::is_directory(a_path, ec)) {
			sources.push_back(a_path);
			return sources;
		}

		std::filesystem::directory_iterator it(a_path, ec);
		if (ec) {
			spdlog::warn("OrphanGear: failed to list script directory {} ({})", a_path.string(), ec.message());
			return sources;
		}

		for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
			if (ec) {
				spdlog::warn("OrphanGear: stopped listing script directory {} ({})", a_path.string(), ec.message());
				break;
			}

			std::error_code entryEc;
			if (!it->is_regular_file(entryEc)) {
				continue;
			}
			const auto extension = it->path().extension().string();
			if (detail::EqualsCaseInsensitiveAscii(extension, a_extension)) {
				sources.push_back(it->path());
			}
		}

		std::sort(sources.begin(), sources.end());
		return sources;
	}

	ScriptExtraction ExtractFromSources(const std::vector<std::filesystem::path>& a_paths)
	{
		ScriptExtraction extraction{};
		extraction.sources.reserve(a_paths.size());

		std::string text;
		for (const auto& path : a_paths) {
			ScriptSourceResult result{};
			result.path = path;
			result.status = ReadScriptSource(path, text);
			if (result.status == ScriptReadStatus::kRead) {
				result.references = ExtractReferences(text);
				for (const auto& reference : result.references) {
					extraction.references.insert(reference);
				}
				spdlog::debug(
					"OrphanGear: {} reference(s) in {}",
					result.references.size(),
					path.string());
			}
			extraction.sources.push_back(std::move(result));
		}

		return extraction;
	}
}
