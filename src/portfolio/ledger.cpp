// src/portfolio/ledger.cpp

#include "hedge_ngin/portfolio/ledger.hpp"
#include <cmath>
#include "hedge_ngin/core/time_utils.hpp"

namespace hedge_ngin {

PortfolioLedger::PortfolioLedger(double initial_cash, double margin_requirement)
    : initial_cash_(initial_cash), margin_requirement_(margin_requirement) {
    portfolio_.cash = initial_cash;
}

Result<double> PortfolioLedger::apply_fill(Portfolio& portfolio, const std::string& ticker,
                                           Action action, Quantity quantity, Price price,
                                           double margin_requirement) {
    if (quantity < 0) {
        return make_error<double>(ErrorCode::INVALID_ORDER,
                                  "Negative quantity for " + ticker, "PortfolioLedger");
    }
    if (action == Action::HOLD || quantity == 0) {
        return Result<double>(0.0);
    }
    if (!std::isfinite(price) || price <= 0.0) {
        return make_error<double>(ErrorCode::INVALID_ORDER,
                                  "No valid price for " + ticker, "PortfolioLedger");
    }

    Position position = portfolio.position(ticker);
    const double q = static_cast<double>(quantity);
    const double notional = q * price;
    double realized = 0.0;

    switch (action) {
        case Action::BUY: {
            if (notional > portfolio.free_cash() + kTolerance) {
                return make_error<double>(ErrorCode::INSUFFICIENT_FUNDS,
                                          "Buy of " + std::to_string(quantity) + " " + ticker +
                                              " costs " + std::to_string(notional) +
                                              ", free cash " +
                                              std::to_string(portfolio.free_cash()),
                                          "PortfolioLedger");
            }
            double old_quantity = static_cast<double>(position.long_quantity);
            position.long_cost_basis =
                (old_quantity * position.long_cost_basis + notional) / (old_quantity + q);
            position.long_quantity += quantity;
            portfolio.cash -= notional;
            break;
        }
        case Action::SELL: {
            if (quantity > position.long_quantity) {
                return make_error<double>(ErrorCode::INVALID_ORDER,
                                          "Sell of " + std::to_string(quantity) + " " + ticker +
                                              " exceeds long position " +
                                              std::to_string(position.long_quantity),
                                          "PortfolioLedger");
            }
            realized = (price - position.long_cost_basis) * q;
            position.long_quantity -= quantity;
            if (position.long_quantity == 0) {
                position.long_cost_basis = 0.0;
            }
            portfolio.cash += notional;
            break;
        }
        case Action::SHORT: {
            double margin = notional * margin_requirement;
            if (margin > portfolio.free_cash() + kTolerance) {
                return make_error<double>(ErrorCode::INSUFFICIENT_FUNDS,
                                          "Short of " + std::to_string(quantity) + " " + ticker +
                                              " needs margin " + std::to_string(margin) +
                                              ", free cash " +
                                              std::to_string(portfolio.free_cash()),
                                          "PortfolioLedger");
            }
            double old_quantity = static_cast<double>(position.short_quantity);
            position.short_cost_basis =
                (old_quantity * position.short_cost_basis + notional) / (old_quantity + q);
            position.short_quantity += quantity;
            position.short_margin_used += margin;
            portfolio.cash += notional;
            portfolio.margin_used += margin;
            break;
        }
        case Action::COVER: {
            if (quantity > position.short_quantity) {
                return make_error<double>(ErrorCode::INVALID_ORDER,
                                          "Cover of " + std::to_string(quantity) + " " + ticker +
                                              " exceeds short position " +
                                              std::to_string(position.short_quantity),
                                          "PortfolioLedger");
            }
            double release = position.short_margin_used * q /
                             static_cast<double>(position.short_quantity);
            if (quantity == position.short_quantity) {
                release = position.short_margin_used;
            }
            if (notional > portfolio.free_cash() + release + kTolerance) {
                return make_error<double>(ErrorCode::INSUFFICIENT_FUNDS,
                                          "Cover of " + std::to_string(quantity) + " " + ticker +
                                              " costs " + std::to_string(notional) +
                                              ", free cash " +
                                              std::to_string(portfolio.free_cash() + release),
                                          "PortfolioLedger");
            }
            realized = (position.short_cost_basis - price) * q;
            position.short_quantity -= quantity;
            position.short_margin_used -= release;
            if (position.short_quantity == 0) {
                position.short_cost_basis = 0.0;
                position.short_margin_used = 0.0;
            }
            portfolio.margin_used -= release;
            if (std::abs(portfolio.margin_used) < kTolerance) {
                portfolio.margin_used = 0.0;
            }
            portfolio.cash -= notional;
            break;
        }
        case Action::HOLD:
            break;
    }

    if (position.is_flat()) {
        portfolio.positions.erase(ticker);
    } else {
        portfolio.positions[ticker] = position;
    }
    if (action == Action::SELL || action == Action::COVER) {
        portfolio.realized_gains[ticker] += realized;
    }

    return Result<double>(realized);
}

Result<void> PortfolioLedger::check_invariants(const Portfolio& portfolio) {
    if (!std::isfinite(portfolio.cash) || !std::isfinite(portfolio.margin_used)) {
        return make_error<void>(ErrorCode::COMPUTE_ERROR, "Non-finite cash or margin",
                                "PortfolioLedger");
    }
    if (portfolio.margin_used < -kTolerance) {
        return make_error<void>(ErrorCode::COMPUTE_ERROR,
                                "Negative margin used: " + std::to_string(portfolio.margin_used),
                                "PortfolioLedger");
    }
    if (portfolio.cash < portfolio.margin_used - kTolerance) {
        return make_error<void>(ErrorCode::COMPUTE_ERROR,
                                "Cash " + std::to_string(portfolio.cash) +
                                    " below reserved margin " +
                                    std::to_string(portfolio.margin_used),
                                "PortfolioLedger");
    }

    double margin_sum = 0.0;
    for (const auto& [ticker, position] : portfolio.positions) {
        if (position.long_quantity < 0 || position.short_quantity < 0) {
            return make_error<void>(ErrorCode::COMPUTE_ERROR,
                                    "Negative quantity held in " + ticker, "PortfolioLedger");
        }
        margin_sum += position.short_margin_used;
    }
    if (std::abs(margin_sum - portfolio.margin_used) > kTolerance) {
        return make_error<void>(ErrorCode::COMPUTE_ERROR,
                                "Per-ticker margin " + std::to_string(margin_sum) +
                                    " does not match total " +
                                    std::to_string(portfolio.margin_used),
                                "PortfolioLedger");
    }
    return Result<void>();
}

Result<void> PortfolioLedger::commit(const Portfolio& updated) {
    auto valid = check_invariants(updated);
    if (valid.is_error()) {
        return valid;
    }
    portfolio_ = updated;
    return Result<void>();
}

Result<DailySnapshot> PortfolioLedger::record_snapshot(const Timestamp& date,
                                                       const PriceMap& prices) {
    if (!history_.empty() && date <= history_.back().date) {
        return make_error<DailySnapshot>(ErrorCode::COMPUTE_ERROR,
                                         "Snapshot for " + core::format_date(date) +
                                             " does not follow " +
                                             core::format_date(history_.back().date),
                                         "PortfolioLedger");
    }

    DailySnapshot snapshot = DailySnapshot::capture(date, portfolio_, prices, last_value());
    if (!std::isfinite(snapshot.total_value)) {
        return make_error<DailySnapshot>(ErrorCode::COMPUTE_ERROR,
                                         "Non-finite portfolio value on " +
                                             core::format_date(date),
                                         "PortfolioLedger");
    }
    history_.push_back(snapshot);
    return Result<DailySnapshot>(snapshot);
}

}  // namespace hedge_ngin
