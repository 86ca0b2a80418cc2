#include "stoplab/ledger/portfolio_ledger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace stoplab {

namespace {

void validateTrade(std::int64_t qty, double price) {
  if (qty <= 0) {
    throw std::invalid_argument("PortfolioLedger: quantity must be positive");
  }
  if (!std::isfinite(price) || price <= 0.0) {
    throw std::invalid_argument(
        "PortfolioLedger: price must be finite and positive");
  }
}

}  // namespace

PortfolioLedger::PortfolioLedger(double initial_capital,
                                 domain::FeeModel fees,
                                 int sell_settlement_days,
                                 const TradingCalendar& calendar)
    : cash_(initial_capital),
      fees_(fees),
      sell_settlement_days_(sell_settlement_days),
      calendar_(calendar) {
  if (!(initial_capital >= 0.0)) {
    throw std::invalid_argument(
        "PortfolioLedger: initial capital must be non-negative");
  }
  if (sell_settlement_days < 0) {
    throw std::invalid_argument(
        "PortfolioLedger: settlement lag must be non-negative");
  }
}

// -----------------------------------------------------------------------------
// applySell: position down now, cash later
// -----------------------------------------------------------------------------
const domain::Order& PortfolioLedger::applySell(Date date,
                                                const std::string& ticker,
                                                std::int64_t qty, double price,
                                                const std::string& reason) {
  validateTrade(qty, price);
  Holding* holding = find(ticker);
  if (holding == nullptr || holding->quantity < qty) {
    throw std::invalid_argument("PortfolioLedger: sell of " + ticker +
                                " exceeds held quantity");
  }

  const double notional = static_cast<double>(qty) * price;
  const double fee = fees_.feeFor(notional);
  const Date settle = calendar_.offset(date, sell_settlement_days_);

  holding->quantity -= qty;
  pending_.push_back(PendingSettlement{settle, notional - fee});

  domain::Order order;
  order.date = date;
  order.side = domain::Side::Sell;
  order.ticker = ticker;
  order.quantity = qty;
  order.price = price;
  order.fee = fee;
  order.cash_delta_date = settle;
  order.settlement_date = settle;
  order.reason = reason;
  orders_.push_back(std::move(order));
  return orders_.back();
}

// -----------------------------------------------------------------------------
// applyBuy: all or nothing against available cash
// -----------------------------------------------------------------------------
bool PortfolioLedger::applyBuy(Date date, const std::string& ticker,
                               std::int64_t qty, double price,
                               const std::string& reason) {
  validateTrade(qty, price);

  const double notional = static_cast<double>(qty) * price;
  const double fee = fees_.feeFor(notional);
  const double total_cost = notional + fee;
  if (total_cost > cash_) {
    return false;
  }

  cash_ -= total_cost;
  if (Holding* holding = find(ticker)) {
    holding->quantity += qty;
  } else {
    positions_.push_back(Holding{ticker, qty});
  }

  domain::Order order;
  order.date = date;
  order.side = domain::Side::Buy;
  order.ticker = ticker;
  order.quantity = qty;
  order.price = price;
  order.fee = fee;
  order.cash_delta_date = date;
  order.settlement_date = date;
  order.reason = reason;
  orders_.push_back(std::move(order));
  return true;
}

double PortfolioLedger::settleCash(Date current) {
  double settled = 0.0;
  std::vector<PendingSettlement> remaining;
  remaining.reserve(pending_.size());
  for (const auto& item : pending_) {
    if (item.settle_date <= current) {
      settled += item.amount;
    } else {
      remaining.push_back(item);
    }
  }
  pending_.swap(remaining);
  cash_ += settled;
  return settled;
}

void PortfolioLedger::advanceQuarantine() {
  for (auto it = quarantine_.begin(); it != quarantine_.end();) {
    if (--it->second <= 0) {
      it = quarantine_.erase(it);
    } else {
      ++it;
    }
  }
}

void PortfolioLedger::quarantine(const std::string& ticker, int sessions) {
  if (sessions <= 0) {
    quarantine_.erase(ticker);
    return;
  }
  quarantine_[ticker] = sessions;
}

void PortfolioLedger::dropEmptyPositions() {
  positions_.erase(std::remove_if(positions_.begin(), positions_.end(),
                                  [](const Holding& h) {
                                    return h.quantity <= 0;
                                  }),
                   positions_.end());
}

double PortfolioLedger::pendingTotal() const {
  double total = 0.0;
  for (const auto& item : pending_) {
    total += item.amount;
  }
  return total;
}

std::int64_t PortfolioLedger::quantity(const std::string& ticker) const {
  const Holding* holding = find(ticker);
  return holding != nullptr ? holding->quantity : 0;
}

std::size_t PortfolioLedger::openPositionCount() const {
  return static_cast<std::size_t>(
      std::count_if(positions_.begin(), positions_.end(),
                    [](const Holding& h) { return h.quantity > 0; }));
}

Holding* PortfolioLedger::find(const std::string& ticker) {
  auto it = std::find_if(positions_.begin(), positions_.end(),
                         [&](const Holding& h) { return h.ticker == ticker; });
  return it != positions_.end() ? &*it : nullptr;
}

const Holding* PortfolioLedger::find(const std::string& ticker) const {
  auto it = std::find_if(positions_.begin(), positions_.end(),
                         [&](const Holding& h) { return h.ticker == ticker; });
  return it != positions_.end() ? &*it : nullptr;
}

}  // namespace stoplab
