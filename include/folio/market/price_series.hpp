// include/folio/market/price_series.hpp

#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include "folio/core/types.hpp"

namespace folio {

/**
 * @brief Immutable price history ordered by ascending timestamp
 *
 * Copies share the same storage. Iteration can be repeated any number of
 * times, and tail() narrows the view to a trailing window without copying.
 * Non-trading days are simply absent; nothing is interpolated.
 */
class PriceSeries {
public:
    using const_iterator = std::vector<PricePoint>::const_iterator;

    PriceSeries() : points_(std::make_shared<const std::vector<PricePoint>>()) {}

    PriceSeries(std::string symbol, std::vector<PricePoint> points) : symbol_(std::move(symbol)) {
        std::stable_sort(points.begin(), points.end(),
                         [](const PricePoint& a, const PricePoint& b) {
                             return a.timestamp < b.timestamp;
                         });
        count_ = points.size();
        points_ = std::make_shared<const std::vector<PricePoint>>(std::move(points));
    }

    const std::string& symbol() const {
        return symbol_;
    }

    const_iterator begin() const {
        return points_->begin() + static_cast<std::ptrdiff_t>(offset_);
    }

    const_iterator end() const {
        return begin() + static_cast<std::ptrdiff_t>(count_);
    }

    size_t size() const {
        return count_;
    }

    bool empty() const {
        return count_ == 0;
    }

    const PricePoint& back() const {
        return *(end() - 1);
    }

    /**
     * @brief View over the last n points (or all of them if fewer)
     */
    PriceSeries tail(size_t n) const {
        PriceSeries view(*this);
        if (n < count_) {
            view.offset_ = offset_ + (count_ - n);
            view.count_ = n;
        }
        return view;
    }

    std::vector<Price> prices() const {
        std::vector<Price> out;
        out.reserve(count_);
        for (const auto& point : *this) {
            out.push_back(point.price);
        }
        return out;
    }

private:
    std::string symbol_;
    std::shared_ptr<const std::vector<PricePoint>> points_;
    size_t offset_{0};
    size_t count_{0};
};

}  // namespace folio
