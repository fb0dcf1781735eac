#pragma once

// ============================================================================
// SnapshotBuilder: 从库里取数据, 调用 aggregate(), 可选持久化
//
// 每个实例持有独立的 TradeStore 连接, backtest worker 各自构造一个
// 持久化走 Database 写连接 (INSERT OR REPLACE 按 (market_id, snapshot_time) 覆盖)
// ============================================================================

#include "../belief/belief_engine.hpp"
#include "../core/database.hpp"
#include "../core/schema.hpp"
#include "../metrics/wallet_metrics.hpp"
#include "../store/trade_store.hpp"
#include "../weights/wallet_weights.hpp"
#include "aggregator.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace snapshot {

class UnknownMarketError : public std::runtime_error {
public:
  explicit UnknownMarketError(const std::string &market_id)
      : std::runtime_error("Market does not exist: " + market_id), market_id_(market_id) {}

  const std::string &market_id() const { return market_id_; }

private:
  std::string market_id_;
};

class SnapshotBuilder {
public:
  SnapshotBuilder(Database &db, double half_life_hours = BELIEF_DEFAULT_HALF_LIFE_HOURS)
      : db_(db), store_(db.get_duckdb()), half_life_hours_(half_life_hours) {}

  // snapshot_time 缺省为当前时间
  MarketSnapshot build(const std::string &market_id, std::optional<int64_t> snapshot_time = std::nullopt,
                       bool persist = true) {
    auto market = store_.find_market(market_id);
    if (!market)
      throw UnknownMarketError(market_id);

    int64_t at = snapshot_time ? *snapshot_time : now_unix();
    std::string horizon = metrics::horizon_bucket(market->end_time, at);
    double market_prob = store_.market_prob_at(market_id, at);

    auto trades = store_.wallet_trades(market_id, at);
    std::vector<std::string> wallets;
    wallets.reserve(trades.size());
    for (const auto &[wallet, rows] : trades)
      wallets.push_back(wallet);

    weights::WeightLookup lookup;
    lookup.load(store_.connection(), wallets);
    auto profiles = metrics::load_global_profiles(store_.connection(), wallets);

    std::vector<WalletSignal> signals;
    signals.reserve(trades.size());
    for (const auto &[wallet, rows] : trades) {
      auto sig = belief::infer_belief(rows, at, half_life_hours_);
      auto it = profiles.find(wallet);
      Cohort cohort = classify(it == profiles.end() ? nullptr : &it->second, sig.churn, sig.confidence);
      auto ws = make_wallet_signal(wallet, sig, lookup.find(wallet, market->category, horizon), cohort);
      if (ws)
        signals.push_back(std::move(*ws));
    }

    auto snap = aggregate(market_id, at, market_prob, signals);
    if (persist)
      save(snap);
    return snap;
  }

  void save(const MarketSnapshot &s) {
    std::string values = schema::escape_sql(s.market_id) + ", " + std::to_string(s.snapshot_time) + ", " +
                         schema::sql_double(s.market_prob) + ", " + schema::sql_double(s.aggregate_prob) + ", " +
                         schema::sql_double(s.divergence) + ", " + schema::sql_double(s.confidence) + ", " +
                         schema::sql_double(s.disagreement) + ", " + schema::sql_double(s.participation_quality) +
                         ", " + schema::sql_double(s.integrity_risk) + ", " + std::to_string(s.active_wallets) +
                         ", " + schema::escape_sql(s.top_drivers.dump()) + ", " +
                         schema::escape_sql(s.cohort_summary.dump()) + ", " +
                         schema::escape_sql(s.flip_conditions.dump()) + ", " +
                         schema::escape_sql(s.explanation.dump());
    db_.batch_insert("smartcrowd_snapshots",
                     "market_id, snapshot_time, market_prob, smartcrowd_prob, divergence, confidence, disagreement, "
                     "participation_quality, integrity_risk, active_wallets, top_drivers, cohort_summary, "
                     "flip_conditions, explanation_json",
                     {values});
  }

  store::TradeStore &store() { return store_; }

private:
  Database &db_;
  store::TradeStore store_;
  double half_life_hours_;
};

inline MarketSnapshot build_market_snapshot(Database &db, const std::string &market_id,
                                            std::optional<int64_t> snapshot_time = std::nullopt, bool persist = true,
                                            double half_life_hours = BELIEF_DEFAULT_HALF_LIFE_HOURS) {
  return SnapshotBuilder(db, half_life_hours).build(market_id, snapshot_time, persist);
}

// ============================================================================
// 批量: 所有有成交的市场各写一个快照
// ============================================================================
inline int64_t build_snapshots_for_all_markets(Database &db, std::optional<int64_t> snapshot_time,
                                               bool include_resolved,
                                               double half_life_hours = BELIEF_DEFAULT_HALF_LIFE_HOURS) {
  auto t0 = std::chrono::steady_clock::now();
  SnapshotBuilder builder(db, half_life_hours);
  auto ids = builder.store().market_ids_with_trades(include_resolved);
  for (const auto &id : ids)
    builder.build(id, snapshot_time, true);

  auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
  std::cout << "[snapshot] " << ids.size() << " markets | " << static_cast<int>(ms) << "ms" << std::endl;
  return static_cast<int64_t>(ids.size());
}

// ============================================================================
// 历史回填: 每个市场在 [首笔成交, min(end, resolution, now)] 之间等距写 n_points 个快照
// ============================================================================
inline int64_t backfill_market_snapshots(Database &db, int n_points, bool include_resolved,
                                         double half_life_hours = BELIEF_DEFAULT_HALF_LIFE_HOURS) {
  if (n_points <= 0)
    return 0;
  auto t0 = std::chrono::steady_clock::now();
  SnapshotBuilder builder(db, half_life_hours);
  auto &store = builder.store();
  int64_t now = now_unix();
  int64_t written = 0;

  for (const auto &id : store.market_ids_with_trades(include_resolved)) {
    auto market = store.find_market(id);
    auto range = store.trade_time_range(id);
    if (!market || !range)
      continue;

    int64_t close = std::min(market->end_time, now);
    if (auto outcome = store.find_outcome(id))
      close = std::min(close, outcome->resolution_time);
    int64_t first = range->first;
    if (close < first)
      continue;

    for (int i = 0; i < n_points; ++i) {
      int64_t at = n_points == 1 ? close
                                 : first + static_cast<int64_t>(static_cast<double>(close - first) * i /
                                                                (n_points - 1));
      builder.build(id, at, true);
      ++written;
    }
  }

  auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
  std::cout << "[snapshot] backfill " << written << " points | " << static_cast<int>(ms) << "ms" << std::endl;
  return written;
}

// ============================================================================
// Screener: 每个市场最新快照, 按 |divergence| 降序
// ============================================================================
inline json latest_screener_rows(Database &db, int limit = 25, double min_confidence = 0.0) {
  return db.query_json(
      "WITH latest AS ("
      "  SELECT market_id, MAX(snapshot_time) AS snapshot_time FROM smartcrowd_snapshots GROUP BY market_id"
      ") "
      "SELECT s.market_id, s.snapshot_time, s.market_prob, s.smartcrowd_prob, s.divergence, s.confidence, "
      "       s.disagreement, s.participation_quality, s.integrity_risk, s.active_wallets, "
      "       s.top_drivers, s.cohort_summary, s.flip_conditions, s.explanation_json, "
      "       m.question, m.category, m.end_time "
      "FROM smartcrowd_snapshots s "
      "JOIN latest l ON s.market_id = l.market_id AND s.snapshot_time = l.snapshot_time "
      "JOIN markets m ON m.id = s.market_id "
      "WHERE s.confidence >= " + schema::sql_double(min_confidence) +
      " ORDER BY ABS(s.divergence) DESC, s.market_id LIMIT " + std::to_string(std::max(0, limit)));
}

} // namespace snapshot
