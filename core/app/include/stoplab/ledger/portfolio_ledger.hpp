#pragma once

#include "stoplab/domain/order.hpp"
#include "stoplab/domain/simulation_config.hpp"
#include "stoplab/time/date.hpp"
#include "stoplab/time/trading_calendar.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace stoplab {

// Net sale proceeds waiting for their settlement session.
struct PendingSettlement {
  Date settle_date;
  double amount{0.0};
};

// One open position. Quantity is whole shares and never negative.
struct Holding {
  std::string ticker;
  std::int64_t quantity{0};
};

// -----------------------------------------------------------------------------
// PortfolioLedger: cash, positions, pending settlements and quarantine
// -----------------------------------------------------------------------------
//
// @brief  The single mutable state of a replay. Every buy, sell, settlement
//         and quarantine change goes through this class and every accepted
//         trade is appended to the order log.
//
// @details
// Cash timing rules (strictly enforced):
//
//   Buy   cash is debited immediately by notional + fee. A buy whose total
//         cost exceeds the available cash is rejected as a whole: nothing
//         is debited and no order is logged.
//
//   Sell  cash is NOT touched. The net proceeds (notional - fee) are parked
//         in the pending list with
//           settle_date = calendar.offset(date, sell_settlement_days)
//         and move into cash on the first settleCash(D) with D >= settle_date.
//
// Consequently cash() never goes negative and a sale can never fund a buy
// on the same day.
//
// Positions are kept in the order they were first opened. A position sold
// down to zero stays in the list (with quantity 0) until
// dropEmptyPositions() is called, so the caller decides when it disappears.
//
// Quarantine:
//   quarantine(t, n) sets a counter of n sessions. advanceQuarantine()
//   decrements every counter and removes those that reach 0. With
//   quarantine_sessions = n and the decrement running at the start of each
//   session, a ticker zeroed on session S is blocked through S + n - 1.
//
// Thread model:
//   Single owner (SimulationEngine), single thread, no locks. Holds a
//   reference to the TradingCalendar, which must outlive the ledger.
// -----------------------------------------------------------------------------
class PortfolioLedger {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  initial_capital       Starting cash, must be >= 0.
  // @param  fees                  Fee model applied to every order.
  // @param  sell_settlement_days  Sessions between a sale and its cash.
  // @param  calendar              Session list used for settlement dates.
  //
  // @throws std::invalid_argument on negative capital or settlement lag.
  // -------------------------------------------------------------------------
  PortfolioLedger(double initial_capital, domain::FeeModel fees,
                  int sell_settlement_days, const TradingCalendar& calendar);

  // -------------------------------------------------------------------------
  // applySell(date, ticker, qty, price, reason)
  // -------------------------------------------------------------------------
  // What: Reduces an open position by qty shares. Parks notional - fee in
  // the pending list and logs a SELL order whose cash_delta_date and
  // settlement_date are both calendar.offset(date, sell_settlement_days),
  // clamped to the last session.
  // Why: ZERO and REDUCE decisions both end here. Cash only changes later,
  // in settleCash().
  // Input: date, a calendar session. ticker, qty (shares, 1..held) and
  // price (the asof close). reason, the rule id written to the order log.
  // Output: The logged order. The reference stays valid until the next
  // trade.
  // @throws std::invalid_argument if qty <= 0, price is not finite and
  //         positive, or qty exceeds the held quantity.
  // @throws std::out_of_range if date is not a calendar session.
  // On a throw the ledger is unchanged.
  // -------------------------------------------------------------------------
  const domain::Order& applySell(Date date, const std::string& ticker,
                                 std::int64_t qty, double price,
                                 const std::string& reason);

  // -------------------------------------------------------------------------
  // applyBuy(date, ticker, qty, price, reason)
  // -------------------------------------------------------------------------
  // What: Buys qty shares if cash covers notional + fee. Debits cash at
  // once, opens or grows the position, and logs a BUY order settled on
  // date.
  // Why: The weekly buy sizes its order from cash(). Insufficient cash is
  // a normal outcome here, not a programming error.
  // Input: date, ticker, qty > 0, price (finite, > 0), reason.
  // Output: bool, true when executed and logged, false when rejected for
  // insufficient cash. A rejected buy leaves the state unchanged.
  // @throws std::invalid_argument if qty <= 0 or price is not finite and
  //         positive.
  // -------------------------------------------------------------------------
  bool applyBuy(Date date, const std::string& ticker, std::int64_t qty,
                double price, const std::string& reason);

  // -------------------------------------------------------------------------
  // settleCash(current)
  // -------------------------------------------------------------------------
  // What: Moves every pending amount with settle_date <= current into cash
  // and removes it from the pending list.
  // Why: Runs first thing on each simulated day, before any buy, so
  // proceeds arriving today can fund today's weekly buy.
  // Input: current, the session being simulated.
  // Output: double, the amount settled (0 when nothing was due).
  // -------------------------------------------------------------------------
  double settleCash(Date current);

  // -------------------------------------------------------------------------
  // advanceQuarantine()
  // -------------------------------------------------------------------------
  // What: Decrements every quarantine counter by one session and forgets
  // the tickers that reach 0.
  // Why: Called once at the start of each simulated session, before
  // settlement and decisions.
  // -------------------------------------------------------------------------
  void advanceQuarantine();

  // Starts (or restarts) a quarantine of `sessions`. Non-positive values
  // clear it.
  void quarantine(const std::string& ticker, int sessions);
  bool isQuarantined(const std::string& ticker) const {
    return quarantine_.count(ticker) > 0;
  }

  // Removes positions whose quantity reached 0.
  void dropEmptyPositions();

  // Settled cash, never negative.
  double cash() const { return cash_; }
  // Sum of the unsettled sale proceeds.
  double pendingTotal() const;
  const std::vector<PendingSettlement>& pending() const { return pending_; }

  const std::vector<Holding>& positions() const { return positions_; }
  std::int64_t quantity(const std::string& ticker) const;
  bool holds(const std::string& ticker) const { return quantity(ticker) > 0; }

  // Positions with a non-zero quantity.
  std::size_t openPositionCount() const;

  const std::vector<domain::Order>& orders() const { return orders_; }
  const std::map<std::string, int>& quarantined() const { return quarantine_; }

  const domain::FeeModel& fees() const { return fees_; }

 private:
  Holding* find(const std::string& ticker);
  const Holding* find(const std::string& ticker) const;

  double cash_;
  domain::FeeModel fees_;
  int sell_settlement_days_;
  const TradingCalendar& calendar_;

  std::vector<Holding> positions_;
  std::vector<PendingSettlement> pending_;
  std::map<std::string, int> quarantine_;
  std::vector<domain::Order> orders_;
};

}  // namespace stoplab
