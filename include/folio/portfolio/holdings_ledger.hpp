// include/folio/portfolio/holdings_ledger.hpp

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "folio/core/error.hpp"
#include "folio/core/types.hpp"
#include "folio/portfolio/transaction.hpp"

namespace folio {

class SymbolNormalizer;

/**
 * @brief Holding derived from the transaction sequence of one symbol
 */
struct Position {
    std::string symbol;
    Quantity net_quantity{0.0};   // sum(buys) - sum(sells)
    Price average_cost{0.0};      // Weighted average cost of buys
    double realized_pnl{0.0};     // (sell price - average cost) * sold quantity
    Quantity bought_quantity{0.0};
    Quantity sold_quantity{0.0};
    Timestamp last_update;

    Position() = default;
    Position(std::string sym, Quantity qty, Price avg_cost)
        : symbol(std::move(sym)), net_quantity(qty), average_cost(avg_cost) {}

    bool is_open() const {
        return net_quantity > 0.0;
    }

    double cost_basis() const {
        return net_quantity * average_cost;
    }
};

inline bool operator==(const Position& a, const Position& b) {
    return a.symbol == b.symbol && a.net_quantity == b.net_quantity &&
           a.average_cost == b.average_cost && a.realized_pnl == b.realized_pnl &&
           a.bought_quantity == b.bought_quantity && a.sold_quantity == b.sold_quantity &&
           a.last_update == b.last_update;
}

using PositionMap = std::map<std::string, Position>;

/**
 * @brief One rejected record of a batch
 */
struct RecordRejection {
    size_t index{0};  // Position of the record in the batch
    ErrorCode code{ErrorCode::INVALID_TRANSACTION};
    std::string reason;
};

/**
 * @brief Outcome of applying a batch of inbound records
 */
struct BatchReport {
    size_t applied{0};
    std::vector<RecordRejection> rejections;
};

/**
 * @brief Append-only transaction log with derived positions
 *
 * Positions use average-cost accounting: buys move the weighted average
 * cost, sells reduce net quantity only. apply() validates before touching
 * any state, so a rejected transaction leaves the ledger exactly as it was.
 * The ledger is an explicit object owned by its caller.
 */
class HoldingsLedger {
public:
    /**
     * Quantities below this are treated as zero after a sell
     */
    static constexpr Quantity QUANTITY_EPSILON = 1e-9;

    HoldingsLedger() = default;
    HoldingsLedger(HoldingsLedger&& other) noexcept;
    HoldingsLedger& operator=(HoldingsLedger&& other) noexcept;
    HoldingsLedger(const HoldingsLedger&) = delete;
    HoldingsLedger& operator=(const HoldingsLedger&) = delete;

    /**
     * @brief Validate and append a transaction
     * @param tx Transaction with a normalized symbol
     * @return Updated position, INVALID_TRANSACTION or INSUFFICIENT_POSITION
     */
    Result<Position> apply(const Transaction& tx);

    /**
     * @brief Parse and apply inbound records in order
     *
     * Each malformed or rejected record is reported with its index; the
     * remaining records are still applied.
     */
    BatchReport apply_batch(const std::vector<TransactionRecord>& records,
                            const SymbolNormalizer& normalizer);

    /**
     * @brief Open positions (net quantity > 0) keyed by symbol
     */
    PositionMap positions() const;

    /**
     * @brief Position for a symbol, closed positions included
     */
    Result<Position> position(const std::string& symbol) const;

    std::vector<Transaction> transactions() const;

    size_t size() const;

    /**
     * @brief Rebuild position state by replaying a transaction sequence
     *
     * @return All positions touched by the sequence (closed ones included),
     *         or the first error encountered
     */
    static Result<PositionMap> replay(const std::vector<Transaction>& transactions);

    /**
     * @brief Rebuild a ledger from a persisted transaction log
     */
    static Result<HoldingsLedger> from_transactions(const std::vector<Transaction>& transactions);

private:
    /**
     * @brief Compute the position after applying tx, without mutating anything
     */
    static Result<Position> next_position(const Position& current, const Transaction& tx);

    mutable std::mutex mutex_;
    std::vector<Transaction> transactions_;
    PositionMap state_;  // Every symbol ever traded, closed positions included
};

}  // namespace folio
