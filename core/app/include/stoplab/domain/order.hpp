#pragma once

#include "stoplab/time/date.hpp"

#include <cstdint>
#include <string>

namespace stoplab {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Direction of a ledger order. The replay is sell-only for risk decisions;
// Buy only appears for calendar-driven allocation (WEEKLY_BUY).
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// "BUY" / "SELL", the spelling used in the order log.
inline const char* toString(Side side) {
  return side == Side::Buy ? "BUY" : "SELL";
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: One executed row of the append-only order log.
//
// @details
// Created by PortfolioLedger when a buy or sell is accepted and never
// mutated afterwards. Field order mirrors the reconciliation layout consumed
// by downstream audits:
//
//   date, action, ticker, qty, price, fee_total, cash_delta_date,
//   settlement_date, rule_id_or_reason
//
// Cash timing:
//   Buy   cash_delta_date == settlement_date == date (cash leaves at once).
//   Sell  cash_delta_date == settlement_date == date + settlement lag; the
//         net proceeds sit in the pending list until then.
// -----------------------------------------------------------------------------
struct Order {
  Date date;                 // Trading day on which the order was executed
  Side side{Side::Buy};      // BUY or SELL
  std::string ticker;        // Instrument identifier
  std::int64_t quantity{0};  // Whole shares, always > 0
  double price{0.0};         // Execution price (asof close)
  double fee{0.0};           // notional * fee_percent + fee_fixed
  Date cash_delta_date;      // Day the cash balance changes
  Date settlement_date;      // Day the trade settles
  std::string reason;        // Rule id (sells) or "WEEKLY_BUY"
};

// -----------------------------------------------------------------------------
// EquitySnapshot
// -----------------------------------------------------------------------------
// One row of the equity curve: cash + marked positions + pending
// settlements, recorded at the end of each simulated day.
// -----------------------------------------------------------------------------
struct EquitySnapshot {
  Date date;
  double equity{0.0};
};

}  // namespace domain
}  // namespace stoplab
