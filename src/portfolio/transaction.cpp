#include "folio/portfolio/transaction.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include "folio/core/time_utils.hpp"
#include "folio/market/symbol_normalizer.hpp"

namespace folio {

namespace {

const char* kComponent = "TransactionParser";

std::string trim(const std::string& text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(text.begin(), text.end(), is_space);
    auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string();
}

Result<double> parse_positive(const std::string& text, const std::string& field) {
    std::string cleaned = trim(text);
    if (cleaned.empty()) {
        return make_error<double>(ErrorCode::INVALID_TRANSACTION, field + " is missing",
                                  kComponent);
    }

    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(cleaned, &consumed);
    } catch (const std::exception&) {
        return make_error<double>(ErrorCode::INVALID_TRANSACTION,
                                  field + " is not a number: '" + cleaned + "'", kComponent);
    }

    if (consumed != cleaned.size() || !std::isfinite(value)) {
        return make_error<double>(ErrorCode::INVALID_TRANSACTION,
                                  field + " is not a number: '" + cleaned + "'", kComponent);
    }
    if (value <= 0.0) {
        return make_error<double>(ErrorCode::INVALID_TRANSACTION,
                                  field + " must be positive, got " + cleaned, kComponent);
    }
    return value;
}

}  // namespace

Side parse_side(const std::string& text) {
    std::string lowered = trim(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "buy") {
        return Side::BUY;
    }
    if (lowered == "sell") {
        return Side::SELL;
    }
    return Side::NONE;
}

Result<Timestamp> parse_timestamp(const std::string& text) {
    std::string cleaned = trim(text);
    int year = 0;
    unsigned month = 0, day = 0;
    int hour = 0, minute = 0, second = 0;
    char sep = 0;
    int consumed = 0;

    int fields = std::sscanf(cleaned.c_str(), "%4d-%2u-%2u%n", &year, &month, &day, &consumed);
    if (fields != 3) {
        return make_error<Timestamp>(ErrorCode::INVALID_TRANSACTION,
                                     "timestamp is not a YYYY-MM-DD date: '" + cleaned + "'",
                                     kComponent);
    }

    if (static_cast<size_t>(consumed) < cleaned.size()) {
        int hm_end = -1, hms_end = -1;
        int time_fields = std::sscanf(cleaned.c_str() + consumed, "%c%2d:%2d%n:%2d%n", &sep, &hour,
                                      &minute, &hm_end, &second, &hms_end);
        int time_end = time_fields == 4 ? hms_end : hm_end;
        if (time_fields < 3 || (sep != 'T' && sep != ' ') || time_end < 0 ||
            static_cast<size_t>(consumed + time_end) != cleaned.size()) {
            return make_error<Timestamp>(ErrorCode::INVALID_TRANSACTION,
                                         "timestamp has a malformed time part: '" + cleaned + "'",
                                         kComponent);
        }
    }

    static const unsigned kDaysInMonth[] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month < 1 || month > 12 || day < 1 || day > kDaysInMonth[month - 1] ||
        (month == 2 && day == 29 && !leap) || hour < 0 || hour > 23 || minute < 0 ||
        minute > 59 || second < 0 || second > 60) {
        return make_error<Timestamp>(ErrorCode::INVALID_TRANSACTION,
                                     "timestamp is out of range: '" + cleaned + "'", kComponent);
    }

    return core::make_utc_timestamp(year, month, day, hour, minute, second);
}

Result<Transaction> parse_transaction_record(const TransactionRecord& record,
                                             const SymbolNormalizer& normalizer) {
    std::string symbol = normalizer.normalize(record.symbol);
    if (symbol.empty()) {
        return make_error<Transaction>(ErrorCode::INVALID_TRANSACTION, "symbol is missing",
                                       kComponent);
    }

    Side side = parse_side(record.side);
    if (side == Side::NONE) {
        return make_error<Transaction>(ErrorCode::INVALID_TRANSACTION,
                                       "side must be buy or sell, got '" + record.side + "'",
                                       kComponent);
    }

    auto quantity = parse_positive(record.quantity, "quantity");
    if (quantity.is_error()) {
        return make_error<Transaction>(quantity.error()->code(), quantity.error()->what(),
                                       kComponent);
    }

    auto price = parse_positive(record.unit_price, "unit_price");
    if (price.is_error()) {
        return make_error<Transaction>(price.error()->code(), price.error()->what(), kComponent);
    }

    auto timestamp = parse_timestamp(record.timestamp);
    if (timestamp.is_error()) {
        return make_error<Transaction>(timestamp.error()->code(), timestamp.error()->what(),
                                       kComponent);
    }

    return Transaction(symbol, side, quantity.value(), price.value(), timestamp.value());
}

}  // namespace folio
