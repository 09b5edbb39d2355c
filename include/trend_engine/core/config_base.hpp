// include/trend_engine/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "trend_engine/core/error.hpp"

namespace trend_engine {

/**
 * @brief JSON-backed configuration section
 *
 * Sections read only the keys present in the input, so a partial file keeps
 * the defaults for everything it omits.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the section as pretty-printed JSON, replacing the file atomically
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read the section from a JSON file
     * @return FILE_NOT_FOUND, FILE_IO_ERROR or JSON_PARSE_ERROR on failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    std::string dump(int indent = 4) const;

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace trend_engine
