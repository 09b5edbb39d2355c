// src/core/config_base.cpp
#include "trend_engine/core/config_base.hpp"
#include <filesystem>
#include <fstream>

namespace trend_engine {

namespace {

Result<nlohmann::json> read_json_file(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Config file not found: " + filepath, "ConfigBase");
    }
    std::ifstream in(filepath);
    if (!in) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR, "Cannot read " + filepath,
                                          "ConfigBase");
    }

    // Parse without exceptions so malformed files surface as a typed error
    nlohmann::json parsed = nlohmann::json::parse(in, nullptr, false);
    if (parsed.is_discarded()) {
        return make_error<nlohmann::json>(ErrorCode::JSON_PARSE_ERROR,
                                          "Malformed JSON in " + filepath, "ConfigBase");
    }
    return Result<nlohmann::json>(std::move(parsed));
}

}  // namespace

std::string ConfigBase::dump(int indent) const {
    return to_json().dump(indent);
}

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    const std::string staging = filepath + ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot write " + staging,
                                    "ConfigBase");
        }
        out << dump(4) << '\n';
        if (!out.good()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Short write to " + staging,
                                    "ConfigBase");
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, filepath, ec);
    if (ec) {
        std::filesystem::remove(staging, ec);
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot replace " + filepath,
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    auto parsed = read_json_file(filepath);
    if (parsed.is_error()) {
        return make_error<void>(parsed.error()->code(), parsed.error()->what(), "ConfigBase");
    }

    // Type mismatches inside a section are reported, never half-applied silently
    try {
        from_json(parsed.value());
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Bad value in " + filepath + ": " + e.what(), "ConfigBase");
    }
    return Result<void>();
}

}  // namespace trend_engine
