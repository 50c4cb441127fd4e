// include/folio/portfolio/transaction.hpp

#pragma once

#include <string>
#include "folio/core/error.hpp"
#include "folio/core/types.hpp"

namespace folio {

class SymbolNormalizer;

/**
 * @brief A recorded buy or sell. Immutable once appended to the ledger.
 */
struct Transaction {
    std::string symbol;  // Normalized symbol
    Side side{Side::NONE};
    Quantity quantity{0.0};
    Price unit_price{0.0};
    Timestamp timestamp;

    Transaction() = default;
    Transaction(std::string sym, Side s, Quantity qty, Price price, Timestamp ts)
        : symbol(std::move(sym)), side(s), quantity(qty), unit_price(price), timestamp(ts) {}
};

inline bool operator==(const Transaction& a, const Transaction& b) {
    return a.symbol == b.symbol && a.side == b.side && a.quantity == b.quantity &&
           a.unit_price == b.unit_price && a.timestamp == b.timestamp;
}

/**
 * @brief Inbound transaction fields as entered or imported, before validation
 */
struct TransactionRecord {
    std::string symbol;      // Raw ticker, normalized on parse
    std::string side;        // "buy" or "sell", any case
    std::string quantity;    // Positive decimal
    std::string unit_price;  // Positive decimal
    std::string timestamp;   // YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS (UTC)
};

/**
 * @brief Parse a side string ("buy"/"sell", case-insensitive)
 */
Side parse_side(const std::string& text);

/**
 * @brief Parse a YYYY-MM-DD or YYYY-MM-DD[T ]HH:MM[:SS] UTC date
 */
Result<Timestamp> parse_timestamp(const std::string& text);

/**
 * @brief Validate a raw record and turn it into a Transaction
 *
 * @param record Raw inbound fields
 * @param normalizer Maps the raw ticker to its canonical symbol
 * @return Transaction, or INVALID_TRANSACTION naming the offending field
 */
Result<Transaction> parse_transaction_record(const TransactionRecord& record,
                                             const SymbolNormalizer& normalizer);

}  // namespace folio
