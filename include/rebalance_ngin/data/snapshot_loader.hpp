//include/rebalance_ngin/data/snapshot_loader.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "rebalance_ngin/core/error.hpp"
#include "rebalance_ngin/core/types.hpp"

namespace rebalance_ngin {

/**
 * @brief Position of a portfolio snapshot
 */
struct HoldingRecord {
    std::string symbol;
    Quantity quantity;
    Price price;

    Amount value() const {
        return quantity * price;
    }
};

/**
 * @brief Reads portfolio snapshots (symbol, quantity, price) from CSV files
 *
 * Numeric columns are read as text and parsed as exact decimals.
 */
class SnapshotLoader {
public:
    /**
     * @brief Load a snapshot from a CSV file with a symbol,quantity,price header
     * @param file_path Path to the CSV file
     * @return Result containing the holdings in file order
     */
    static Result<std::vector<HoldingRecord>> load_csv(const std::string& file_path);

    /**
     * @brief Convert an Arrow table with utf8 symbol, quantity and price columns
     * @param table Arrow table
     * @return Result containing the holdings, INVALID_DATA for duplicate
     *         symbols, negative quantities or non-positive prices
     */
    static Result<std::vector<HoldingRecord>> table_to_holdings(
        const std::shared_ptr<arrow::Table>& table);

private:
    /**
     * @brief Extract string value from Arrow array
     * @param array Arrow array containing strings
     * @param index Row index
     * @return Result containing string value
     */
    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);
};

}  // namespace rebalance_ngin
