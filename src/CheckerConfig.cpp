#include "OrphanGear/CheckerConfig.h"

#include <charconv>
#include <fstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace OrphanGear
{
	namespace
	{
		[[nodiscard]] bool ParseContainerSet(const nlohmann::json& a_value, ContainerSet& a_outContainers)
		{
			if (!a_value.is_object() || a_value.empty()) {
				return false;
			}

			ContainerSet parsed{};
			for (const auto& [key, label] : a_value.items()) {
				std::int64_t id = 0;
				const auto* end = key.data() + key.size();
				const auto result = std::from_chars(key.data(), end, id, 10);
				if (key.empty() || result.ec != std::errc{} || result.ptr != end) {
					spdlog::warn("OrphanGear: container id '{}' in config is not an integer.", key);
					return false;
				}
				if (!label.is_string()) {
					spdlog::warn("OrphanGear: container {} in config has no string label.", id);
					return false;
				}
				parsed.containers.emplace(id, label.get<std::string>());
			}

			a_outContainers = std::move(parsed);
			return true;
		}
	}

	void ApplyConfigOverrides(const nlohmann::json& a_root, CheckerConfig& a_config)
	{
		if (!a_root.is_object()) {
			spdlog::warn("OrphanGear: config root is not an object; using defaults.");
			return;
		}

		if (const auto it = a_root.find(std::string(kConfigFieldEquippableContainers)); it != a_root.end()) {
			if (!ParseContainerSet(*it, a_config.equippableContainers)) {
				spdlog::warn(
					"OrphanGear: ignoring invalid '{}' in config; keeping {} default containers.",
					kConfigFieldEquippableContainers,
					a_config.equippableContainers.size());
			}
		}

		if (const auto it = a_root.find(std::string(kConfigFieldEquippableOnly)); it != a_root.end()) {
			if (it->is_boolean()) {
				a_config.equippableOnly = it->get<bool>();
			} else {
				spdlog::warn("OrphanGear: '{}' in config must be a boolean.", kConfigFieldEquippableOnly);
			}
		}

		if (const auto it = a_root.find(std::string(kConfigFieldScriptExtension)); it != a_root.end()) {
			if (it->is_string() && !it->get<std::string>().empty()) {
				a_config.scriptExtension = it->get<std::string>();
				if (a_config.scriptExtension.front() != '.') {
					a_config.scriptExtension.insert(a_config.scriptExtension.begin(), '.');
				}
			} else {
				spdlog::warn("OrphanGear: '{}' in config must be a non-empty string.", kConfigFieldScriptExtension);
			}
		}

		if (const auto it = a_root.find(std::string(kConfigFieldLogLevel)); it != a_root.end()) {
			if (it->is_string()) {
				a_config.logLevel = it->get<std::string>();
			} else {
				spdlog::warn("OrphanGear: '{}' in config must be a string.", kConfigFieldLogLevel);
			}
		}

		if (const auto it = a_root.find(std::string(kConfigFieldLogFile)); it != a_root.end()) {
			if (it->is_string()) {
				a_config.logFile = it->get<std::string>();
			} else {
				spdlog::warn("OrphanGear: '{}' in config must be a string.", kConfigFieldLogFile);
			}
		}
	}

	ConfigLoadStatus LoadCheckerConfig(const std::filesystem::path& a_path, CheckerConfig& a_outConfig)
	{
		std::error_code ec;
		const bool exists = std::filesystem::exists(a_path, ec);
		if (ec) {
			spdlog::warn("OrphanGear: failed to inspect config file {} ({})", a_path.string(), ec.message());
			return ConfigLoadStatus::kIoError;
		}
		if (!exists) {
			spdlog::warn("OrphanGear: config file {} does not exist", a_path.string());
			return ConfigLoadStatus::kMissing;
		}

		std::ifstream in(a_path, std::ios::binary);
		if (!in.is_open()) {
			spdlog::warn("OrphanGear: failed to open config file {}", a_path.string());
			return ConfigLoadStatus::kIoError;
		}

		nlohmann::json root = nlohmann::json::object();
		try {
			in >> root;
		} catch (const std::exception& e) {
			spdlog::warn("OrphanGear: failed to parse config file {} ({})", a_path.string(), e.what());
			return ConfigLoadStatus::kParseError;
		}

		ApplyConfigOverrides(root, a_outConfig);
		return ConfigLoadStatus::kLoaded;
	}
}
