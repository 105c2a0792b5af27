//src/data/snapshot_loader.cpp
#include "rebalance_ngin/data/snapshot_loader.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <set>
#include "rebalance_ngin/core/logger.hpp"

namespace rebalance_ngin {

namespace {

const std::vector<std::string> required_columns = {"symbol", "quantity", "price"};

}  // namespace

Result<std::vector<HoldingRecord>> SnapshotLoader::load_csv(const std::string& file_path) {
    auto input_result = arrow::io::ReadableFile::Open(file_path);
    if (!input_result.ok()) {
        return make_error<std::vector<HoldingRecord>>(
            ErrorCode::FILE_NOT_FOUND,
            "Failed to open snapshot " + file_path + ": " + input_result.status().ToString(),
            "SnapshotLoader");
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    for (const auto& column : required_columns) {
        convert_options.column_types[column] = arrow::utf8();
    }

    auto reader_result =
        arrow::csv::TableReader::Make(arrow::io::default_io_context(), *input_result,
                                      read_options, parse_options, convert_options);
    if (!reader_result.ok()) {
        return make_error<std::vector<HoldingRecord>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to create CSV reader: " + reader_result.status().ToString(),
            "SnapshotLoader");
    }

    auto table_result = (*reader_result)->Read();
    if (!table_result.ok()) {
        return make_error<std::vector<HoldingRecord>>(
            ErrorCode::INVALID_DATA,
            "Failed to read snapshot " + file_path + ": " + table_result.status().ToString(),
            "SnapshotLoader");
    }

    auto holdings = table_to_holdings(*table_result);
    if (holdings.is_ok()) {
        DEBUG("Loaded " << holdings.value().size() << " holdings from " << file_path);
    }
    return holdings;
}

Result<std::vector<HoldingRecord>> SnapshotLoader::table_to_holdings(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<HoldingRecord>>(ErrorCode::INVALID_ARGUMENT,
                                                      "Table pointer is null", "SnapshotLoader");
    }

    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<HoldingRecord>>(
                ErrorCode::INVALID_DATA, "Missing required column: " + col, "SnapshotLoader");
        }
    }

    std::vector<HoldingRecord> holdings;
    if (table->num_rows() == 0) {
        return holdings;
    }

    auto combined = table->CombineChunks();
    if (!combined.ok()) {
        return make_error<std::vector<HoldingRecord>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to combine chunks: " + combined.status().ToString(), "SnapshotLoader");
    }

    auto symbol_array = (*combined)->GetColumnByName("symbol")->chunk(0);
    auto quantity_array = (*combined)->GetColumnByName("quantity")->chunk(0);
    auto price_array = (*combined)->GetColumnByName("price")->chunk(0);

    holdings.reserve((*combined)->num_rows());
    std::set<std::string> symbols;

    for (int64_t i = 0; i < (*combined)->num_rows(); ++i) {
        const std::string row = "row " + std::to_string(i + 1);

        auto symbol_result = extract_string(symbol_array, i);
        auto quantity_text = extract_string(quantity_array, i);
        auto price_text = extract_string(price_array, i);
        if (symbol_result.is_error() || quantity_text.is_error() || price_text.is_error()) {
            return make_error<std::vector<HoldingRecord>>(
                ErrorCode::INVALID_DATA, "Missing value in snapshot " + row, "SnapshotLoader");
        }

        HoldingRecord holding;
        holding.symbol = symbol_result.value();
        if (holding.symbol.empty()) {
            return make_error<std::vector<HoldingRecord>>(
                ErrorCode::INVALID_DATA, "Empty symbol in snapshot " + row, "SnapshotLoader");
        }

        auto quantity = parse_decimal(quantity_text.value(), DecimalRestrictions::NON_NEGATIVE);
        if (quantity.is_error()) {
            return make_error<std::vector<HoldingRecord>>(
                quantity.error()->code(),
                "Invalid quantity for " + holding.symbol + ": " + quantity.error()->what(),
                "SnapshotLoader");
        }

        auto price = parse_decimal(price_text.value(), DecimalRestrictions::STRICTLY_POSITIVE);
        if (price.is_error()) {
            return make_error<std::vector<HoldingRecord>>(
                price.error()->code(),
                "Invalid price for " + holding.symbol + ": " + price.error()->what(),
                "SnapshotLoader");
        }

        if (!symbols.insert(holding.symbol).second) {
            return make_error<std::vector<HoldingRecord>>(
                ErrorCode::INVALID_DATA, "Duplicate holding " + holding.symbol + " at " + row,
                "SnapshotLoader");
        }

        holding.quantity = quantity.value();
        holding.price = price.value();
        holdings.push_back(std::move(holding));
    }

    return holdings;
}

Result<std::string> SnapshotLoader::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "SnapshotLoader");
    }

    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Expected a string column, got " + array->type()->ToString(),
                                       "SnapshotLoader");
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(index)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null string value at index " + std::to_string(index),
                                       "SnapshotLoader");
    }

    return string_array->GetString(index);
}

}  // namespace rebalance_ngin
