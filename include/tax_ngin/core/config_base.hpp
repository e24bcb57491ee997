// include/tax_ngin/core/config_base.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "tax_ngin/core/error.hpp"

namespace tax_ngin {

/**
 * @brief Base class for JSON-backed configuration
 *
 * A file is layered over the current values: keys it names override them,
 * nested objects are merged key by key, and everything else is kept.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Layer a JSON object file over this configuration
     * @param filepath Path to the file
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR (including a non-object
     *         document), or the error raised by from_json
     */
    virtual Result<void> load_from_file(const std::filesystem::path& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Apply the keys present in j
     * @throws TradeError or nlohmann::json::exception on a malformed value
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Recursively merge JSON objects
     * @param target Target JSON object (modified in place)
     * @param source Source JSON object to merge from
     *
     * For nested objects, performs deep merge. For other types, source overwrites target.
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);
};

}  // namespace tax_ngin
