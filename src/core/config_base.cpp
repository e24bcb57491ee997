// src/core/config_base.cpp
#include "tax_ngin/core/config_base.hpp"
#include <fstream>

namespace tax_ngin {

Result<void> ConfigBase::load_from_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open config file: " + filepath.string(), "ConfigBase");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Failed to parse JSON file " + filepath.string() + ": " + e.what(),
                                "ConfigBase");
    }
    if (!j.is_object()) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Config file " + filepath.string() + " must contain a JSON object",
                                "ConfigBase");
    }

    try {
        nlohmann::json merged = to_json();
        merge_json(merged, j);
        from_json(merged);
        return Result<void>();
    } catch (const TradeError& e) {
        return forward_error<void>(e);
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Failed to extract config from " + filepath.string() + ": " +
                                    e.what(),
                                "ConfigBase");
    }
}

void ConfigBase::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

}  // namespace tax_ngin
