#include "folio/portfolio/holdings_ledger.hpp"

#include <cmath>
#include <sstream>
#include "folio/core/logger.hpp"
#include "folio/market/symbol_normalizer.hpp"

namespace folio {

namespace {
const char* kComponent = "HoldingsLedger";

std::string format_quantity(Quantity q) {
    std::ostringstream os;
    os << q;
    return os.str();
}
}  // namespace

HoldingsLedger::HoldingsLedger(HoldingsLedger&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.mutex_);
    transactions_ = std::move(other.transactions_);
    state_ = std::move(other.state_);
}

HoldingsLedger& HoldingsLedger::operator=(HoldingsLedger&& other) noexcept {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        transactions_ = std::move(other.transactions_);
        state_ = std::move(other.state_);
    }
    return *this;
}

Result<Position> HoldingsLedger::next_position(const Position& current, const Transaction& tx) {
    if (tx.symbol.empty()) {
        return make_error<Position>(ErrorCode::INVALID_TRANSACTION, "Transaction has no symbol",
                                    kComponent);
    }
    if (tx.side != Side::BUY && tx.side != Side::SELL) {
        return make_error<Position>(ErrorCode::INVALID_TRANSACTION,
                                    "Transaction side must be buy or sell", kComponent);
    }
    if (!std::isfinite(tx.quantity) || tx.quantity <= 0.0) {
        return make_error<Position>(ErrorCode::INVALID_TRANSACTION,
                                    "Quantity must be positive, got " +
                                        format_quantity(tx.quantity),
                                    kComponent);
    }
    if (!std::isfinite(tx.unit_price) || tx.unit_price <= 0.0) {
        return make_error<Position>(ErrorCode::INVALID_TRANSACTION,
                                    "Unit price must be positive, got " +
                                        format_quantity(tx.unit_price),
                                    kComponent);
    }

    Position next = current;
    next.symbol = tx.symbol;
    next.last_update = tx.timestamp;

    if (tx.side == Side::BUY) {
        const Quantity new_qty = current.net_quantity + tx.quantity;
        next.average_cost =
            (current.net_quantity * current.average_cost + tx.quantity * tx.unit_price) / new_qty;
        next.net_quantity = new_qty;
        next.bought_quantity += tx.quantity;
        return next;
    }

    if (tx.quantity > current.net_quantity + QUANTITY_EPSILON) {
        return make_error<Position>(ErrorCode::INSUFFICIENT_POSITION,
                                    "Cannot sell " + format_quantity(tx.quantity) + " " +
                                        tx.symbol + ", holding " +
                                        format_quantity(current.net_quantity),
                                    kComponent);
    }

    next.net_quantity = current.net_quantity - tx.quantity;
    if (std::abs(next.net_quantity) < QUANTITY_EPSILON) {
        next.net_quantity = 0.0;
    }
    next.realized_pnl += (tx.unit_price - current.average_cost) * tx.quantity;
    next.sold_quantity += tx.quantity;
    return next;
}

Result<Position> HoldingsLedger::apply(const Transaction& tx) {
    std::lock_guard<std::mutex> lock(mutex_);

    Position current;
    auto it = state_.find(tx.symbol);
    if (it != state_.end()) {
        current = it->second;
    }

    auto next = next_position(current, tx);
    if (next.is_error()) {
        INFO("Rejected " << side_to_string(tx.side) << " of " << tx.symbol << ": "
                         << next.error()->what());
        return next;
    }

    // Append first; undo the append if the position write fails
    transactions_.push_back(tx);
    try {
        state_[tx.symbol] = next.value();
    } catch (...) {
        transactions_.pop_back();
        throw;
    }

    DEBUG("Applied " << side_to_string(tx.side) << " " << tx.quantity << " " << tx.symbol
                     << " @ " << tx.unit_price << " -> qty " << next.value().net_quantity
                     << ", avg " << next.value().average_cost);
    return next;
}

BatchReport HoldingsLedger::apply_batch(const std::vector<TransactionRecord>& records,
                                        const SymbolNormalizer& normalizer) {
    BatchReport report;

    for (size_t i = 0; i < records.size(); ++i) {
        auto tx = parse_transaction_record(records[i], normalizer);
        if (tx.is_error()) {
            report.rejections.push_back({i, tx.error()->code(), tx.error()->what()});
            continue;
        }

        auto applied = apply(tx.value());
        if (applied.is_error()) {
            report.rejections.push_back({i, applied.error()->code(), applied.error()->what()});
            continue;
        }
        ++report.applied;
    }

    INFO("Batch applied " << report.applied << " of " << records.size() << " record(s), "
                          << report.rejections.size() << " rejected");
    return report;
}

PositionMap HoldingsLedger::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PositionMap open;
    for (const auto& [symbol, pos] : state_) {
        if (pos.is_open()) {
            open.emplace(symbol, pos);
        }
    }
    return open;
}

Result<Position> HoldingsLedger::position(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.find(symbol);
    if (it == state_.end()) {
        return make_error<Position>(ErrorCode::DATA_NOT_FOUND, "No transactions for " + symbol,
                                    kComponent);
    }
    return it->second;
}

std::vector<Transaction> HoldingsLedger::transactions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transactions_;
}

size_t HoldingsLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transactions_.size();
}

Result<PositionMap> HoldingsLedger::replay(const std::vector<Transaction>& transactions) {
    PositionMap state;
    for (size_t i = 0; i < transactions.size(); ++i) {
        const Transaction& tx = transactions[i];
        Position current;
        auto it = state.find(tx.symbol);
        if (it != state.end()) {
            current = it->second;
        }

        auto next = next_position(current, tx);
        if (next.is_error()) {
            return make_error<PositionMap>(next.error()->code(),
                                           "Replay stopped at transaction " + std::to_string(i) +
                                               ": " + next.error()->what(),
                                           kComponent);
        }
        state[tx.symbol] = next.value();
    }
    return state;
}

Result<HoldingsLedger> HoldingsLedger::from_transactions(
    const std::vector<Transaction>& transactions) {
    HoldingsLedger ledger;
    for (size_t i = 0; i < transactions.size(); ++i) {
        auto applied = ledger.apply(transactions[i]);
        if (applied.is_error()) {
            return make_error<HoldingsLedger>(applied.error()->code(),
                                              "Transaction log entry " + std::to_string(i) +
                                                  " is invalid: " + applied.error()->what(),
                                              kComponent);
        }
    }
    return Result<HoldingsLedger>(std::move(ledger));
}

}  // namespace folio
