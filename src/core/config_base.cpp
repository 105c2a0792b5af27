// src/core/config_base.cpp

#include "rebalance_ngin/core/config_base.hpp"

#include <iomanip>

namespace rebalance_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        nlohmann::json j = to_json();
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + filepath, "ConfigBase");
        }
        file << std::setw(4) << j << std::endl;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error saving config: ") + e.what(), "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                    "Failed to open file for reading: " + filepath, "ConfigBase");
        }
        nlohmann::json j;
        file >> j;
        from_json(j);
        return Result<void>();
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Failed to parse " + filepath + ": " + e.what(), "ConfigBase");
    } catch (const RebalanceError& e) {
        return make_error<void>(e.code(), e.what(), "ConfigBase");
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                std::string("Error loading config: ") + e.what(), "ConfigBase");
    }
}

Decimal decimal_from_json(const nlohmann::json& value, const std::string& field) {
    std::string text;
    if (value.is_string()) {
        text = value.get<std::string>();
    } else if (value.is_number()) {
        text = value.dump();
    } else {
        throw RebalanceError(ErrorCode::INVALID_DATA,
                             "Field " + field + " must be a decimal string or number",
                             "ConfigBase");
    }

    auto parsed = Decimal::parse(text);
    if (parsed.is_error()) {
        throw RebalanceError(ErrorCode::INVALID_DATA,
                             "Invalid value for " + field + ": " + parsed.error()->what(),
                             "ConfigBase");
    }
    return parsed.value();
}

}  // namespace rebalance_ngin
