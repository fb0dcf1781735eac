#pragma once

// ============================================================================
// Backtest Evaluator
//
// 对每个已结算市场, 在 min(end, resolution) - cutoff_hours 时刻重放快照 (不持久化),
// 与真实结果比较 SmartCrowd 概率和市场价格
//
// run_backtest: 单一 cutoff, 写 market_backtests + backtest_reports
// run_backtest_sweep: cutoff = 1..max_hours, 首个无样本的小时停止
// ============================================================================

#include "../core/database.hpp"
#include "../core/schema.hpp"
#include "../metrics/wallet_metrics.hpp"
#include "../snapshot/snapshot_builder.hpp"
#include "../store/trade_store.hpp"

#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace backtest {

using json = nlohmann::json;

static constexpr int CALIBRATION_BINS = 10;
static constexpr size_t TOP_CASES = 8;
static constexpr int MAX_WORKERS = 16;

struct Options {
  int workers = 0; // 0 = hardware_concurrency
  double half_life_hours = BELIEF_DEFAULT_HALF_LIFE_HOURS;
};

struct MarketRecord {
  std::string market_id;
  int64_t cutoff_time = 0;
  double market_prob = 0.5;
  double aggregate_prob = 0.5;
  int outcome = 0;
  double confidence = 0.0;
  double divergence = 0.0;
};

inline std::string new_run_id() {
  auto id = boost::uuids::to_string(boost::uuids::random_generator()());
  id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
  return id;
}

inline int resolve_workers(int requested) {
  int n = requested > 0 ? requested : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  return std::min(n, MAX_WORKERS);
}

// ============================================================================
// 单市场评估, 不满足条件返回 nullopt (不是错误)
// ============================================================================
inline std::optional<MarketRecord> evaluate_market_at_cutoff(snapshot::SnapshotBuilder &builder,
                                                             const store::ResolvedMarket &m, double cutoff_hours,
                                                             int64_t now) {
  int64_t window = static_cast<int64_t>(std::llround(cutoff_hours * 3600.0));
  int64_t close = m.close_time();
  int64_t cutoff = std::min(close - window, now);

  auto first_trade = builder.store().first_trade_at_or_before(m.id, cutoff);
  if (!first_trade)
    return std::nullopt;
  // 交易窗口短于 cutoff_hours: 截止前数据不足
  if (close - *first_trade < window)
    return std::nullopt;

  auto snap = builder.build(m.id, cutoff, false);
  MarketRecord r;
  r.market_id = m.id;
  r.cutoff_time = cutoff;
  r.market_prob = snap.market_prob;
  r.aggregate_prob = snap.aggregate_prob;
  r.outcome = m.outcome;
  r.confidence = snap.confidence;
  r.divergence = snap.divergence;
  return r;
}

// 多 worker 并行评估, 每个 worker 独立 SnapshotBuilder (独立连接); 结果按市场顺序返回
inline std::vector<MarketRecord> evaluate_markets(Database &db, const std::vector<store::ResolvedMarket> &markets,
                                                  double cutoff_hours, const Options &opts) {
  size_t n = markets.size();
  std::vector<std::optional<MarketRecord>> slots(n);
  int64_t now = now_unix();

  int nw = resolve_workers(opts.workers);
  size_t chunk = (n + nw - 1) / std::max(1, nw);

  std::vector<std::future<void>> futs;
  for (int w = 0; w < nw; ++w) {
    size_t s = w * chunk, e = std::min(s + chunk, n);
    if (s >= n)
      break;
    futs.push_back(std::async(std::launch::async, [&, s, e]() {
      snapshot::SnapshotBuilder builder(db, opts.half_life_hours);
      for (size_t i = s; i < e; ++i)
        slots[i] = evaluate_market_at_cutoff(builder, markets[i], cutoff_hours, now);
    }));
  }
  for (auto &f : futs)
    f.get();

  std::vector<MarketRecord> records;
  for (auto &slot : slots) {
    if (slot)
      records.push_back(std::move(*slot));
  }
  return records;
}

// ============================================================================
// 统计
// ============================================================================
inline json calibration_bins(const std::vector<double> &probs, const std::vector<int> &outcomes) {
  std::vector<int64_t> count(CALIBRATION_BINS, 0);
  std::vector<double> sum_prob(CALIBRATION_BINS, 0.0);
  std::vector<double> sum_outcome(CALIBRATION_BINS, 0.0);
  for (size_t i = 0; i < probs.size(); ++i) {
    int idx = std::min(CALIBRATION_BINS - 1, static_cast<int>(probs[i] * CALIBRATION_BINS));
    idx = std::max(0, idx);
    ++count[idx];
    sum_prob[idx] += probs[i];
    sum_outcome[idx] += outcomes[i];
  }

  json out = json::array();
  for (int i = 0; i < CALIBRATION_BINS; ++i) {
    if (count[i] == 0) {
      out.push_back(json{{"bin", i}, {"count", 0}, {"avg_prob", nullptr}, {"empirical", nullptr}});
      continue;
    }
    double c = static_cast<double>(count[i]);
    out.push_back(json{{"bin", i}, {"count", count[i]}, {"avg_prob", sum_prob[i] / c}, {"empirical", sum_outcome[i] / c}});
  }
  return out;
}

struct EdgeBucket {
  double low;
  double high;
  const char *name;
};

inline constexpr EdgeBucket EDGE_BUCKETS[] = {
    {0.00, 0.02, "0-2%"},
    {0.02, 0.05, "2-5%"},
    {0.05, 0.10, "5-10%"},
    {0.10, 1.01, "10%+"},
};

// win = SmartCrowd 绝对误差严格小于市场
inline json edge_bucket_stats(const std::vector<MarketRecord> &records) {
  json out = json::array();
  for (const auto &b : EDGE_BUCKETS) {
    int64_t count = 0;
    int64_t wins = 0;
    double total_edge = 0.0;
    for (const auto &r : records) {
      double d = std::abs(r.divergence);
      if (d < b.low || d >= b.high)
        continue;
      double smart_err = std::abs(r.aggregate_prob - r.outcome);
      double market_err = std::abs(r.market_prob - r.outcome);
      ++count;
      total_edge += market_err - smart_err;
      if (smart_err < market_err)
        ++wins;
    }
    if (count == 0) {
      out.push_back(json{{"bucket", b.name}, {"count", 0}, {"avg_edge", 0.0}, {"win_rate", 0.0}});
      continue;
    }
    double c = static_cast<double>(count);
    out.push_back(json{{"bucket", b.name}, {"count", count}, {"avg_edge", total_edge / c}, {"win_rate", wins / c}});
  }
  return out;
}

struct BrierPair {
  double smartcrowd = 0.0;
  double market = 0.0;
};

inline BrierPair brier_scores(const std::vector<MarketRecord> &records) {
  BrierPair b;
  for (const auto &r : records) {
    b.smartcrowd += (r.aggregate_prob - r.outcome) * (r.aggregate_prob - r.outcome);
    b.market += (r.market_prob - r.outcome) * (r.market_prob - r.outcome);
  }
  double n = static_cast<double>(std::max<size_t>(1, records.size()));
  b.smartcrowd /= n;
  b.market /= n;
  return b;
}

inline const char *winner_label(double smart_err, double market_err) {
  if (smart_err < market_err)
    return "smartcrowd";
  if (smart_err > market_err)
    return "market";
  return "tie";
}

inline json compute_summary(const std::vector<MarketRecord> &records, double cutoff_hours, const std::string &run_id) {
  json summary = {
      {"run_id", run_id},
      {"cutoff_hours", cutoff_hours},
      {"evaluated_at", now_unix()},
      {"total_markets", static_cast<int64_t>(records.size())},
  };
  if (records.empty()) {
    summary["note"] = "No eligible resolved markets with data before cutoff.";
    return summary;
  }

  std::vector<double> market_probs, smart_probs;
  std::vector<int> outcomes;
  double ll_market = 0.0, ll_smart = 0.0;
  for (const auto &r : records) {
    market_probs.push_back(r.market_prob);
    smart_probs.push_back(r.aggregate_prob);
    outcomes.push_back(r.outcome);
    ll_market += metrics::safe_log_loss(r.market_prob, r.outcome);
    ll_smart += metrics::safe_log_loss(r.aggregate_prob, r.outcome);
  }
  double n = static_cast<double>(records.size());
  auto brier = brier_scores(records);

  std::vector<const MarketRecord *> top;
  for (const auto &r : records)
    top.push_back(&r);
  std::stable_sort(top.begin(), top.end(), [](const MarketRecord *a, const MarketRecord *b) {
    return std::abs(a->divergence) > std::abs(b->divergence);
  });
  if (top.size() > TOP_CASES)
    top.resize(TOP_CASES);

  json cases = json::array();
  for (const auto *r : top) {
    double smart_err = std::abs(r->aggregate_prob - r->outcome);
    double market_err = std::abs(r->market_prob - r->outcome);
    cases.push_back(json{
        {"market_id", r->market_id},
        {"cutoff_time", r->cutoff_time},
        {"market_prob", r->market_prob},
        {"smartcrowd_prob", r->aggregate_prob},
        {"outcome", r->outcome},
        {"confidence", r->confidence},
        {"divergence", r->divergence},
        {"smartcrowd_abs_error", smart_err},
        {"market_abs_error", market_err},
        {"winner", winner_label(smart_err, market_err)},
    });
  }

  summary["smartcrowd_brier"] = brier.smartcrowd;
  summary["market_brier"] = brier.market;
  summary["brier_improvement"] = brier.market - brier.smartcrowd;
  summary["log_loss"] = {{"market", ll_market / n}, {"smartcrowd", ll_smart / n}};
  summary["calibration"] = {{"market", calibration_bins(market_probs, outcomes)},
                            {"smartcrowd", calibration_bins(smart_probs, outcomes)}};
  summary["edge_buckets"] = edge_bucket_stats(records);
  summary["top_divergence_cases"] = cases;
  return summary;
}

// ============================================================================
// 入口
// ============================================================================
inline json run_backtest(Database &db, double cutoff_hours = 1.0, std::optional<std::string> run_id = std::nullopt,
                         const Options &opts = Options{}) {
  auto t0 = std::chrono::steady_clock::now();
  std::string id = run_id ? *run_id : new_run_id();

  store::TradeStore store(db.get_duckdb());
  auto markets = store.resolved_markets();
  auto records = evaluate_markets(db, markets, cutoff_hours, opts);
  auto summary = compute_summary(records, cutoff_hours, id);

  std::vector<std::string> values;
  values.reserve(records.size());
  for (const auto &r : records) {
    values.push_back(schema::escape_sql(id) + ", " + schema::escape_sql(r.market_id) + ", " +
                     std::to_string(r.cutoff_time) + ", " + schema::sql_double(r.market_prob) + ", " +
                     schema::sql_double(r.aggregate_prob) + ", " + std::to_string(r.outcome) + ", " +
                     schema::sql_double(r.confidence) + ", " + schema::sql_double(r.divergence));
  }

  {
    Database::Transaction tx(db);
    tx.execute("DELETE FROM market_backtests WHERE run_id = " + schema::escape_sql(id));
    tx.batch_insert("market_backtests",
                    "run_id, market_id, cutoff_time, market_prob, smartcrowd_prob, outcome, confidence, divergence",
                    values);
    tx.batch_insert("backtest_reports", "run_id, generated_at, summary_json",
                    {schema::escape_sql(id) + ", " + std::to_string(now_unix()) + ", " +
                     schema::escape_sql(summary.dump())});
    tx.commit();
  }

  auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
  std::cout << "[backtest] run " << id << ": cutoff_hours=" << cutoff_hours << " resolved=" << markets.size()
            << " eligible=" << records.size() << " | " << static_cast<int>(ms) << "ms" << std::endl;
  return summary;
}

inline json run_backtest_sweep(Database &db, int max_hours = 168, const Options &opts = Options{}) {
  auto t0 = std::chrono::steady_clock::now();
  store::TradeStore store(db.get_duckdb());
  auto markets = store.resolved_markets();

  json hourly = json::array();
  for (int h = 1; h <= max_hours; ++h) {
    auto records = evaluate_markets(db, markets, static_cast<double>(h), opts);
    if (records.empty()) {
      hourly.push_back(json{{"cutoff_hours", h}, {"total_markets", 0}});
      break;
    }
    auto brier = brier_scores(records);
    double improvement = brier.market - brier.smartcrowd;
    double improvement_pct = brier.market > 0 ? improvement / brier.market * 100.0 : 0.0;
    hourly.push_back(json{
        {"cutoff_hours", h},
        {"total_markets", static_cast<int64_t>(records.size())},
        {"smartcrowd_brier", snapshot::round6(brier.smartcrowd)},
        {"market_brier", snapshot::round6(brier.market)},
        {"brier_improvement", snapshot::round6(improvement)},
        {"brier_improvement_pct", std::round(improvement_pct * 100.0) / 100.0},
        {"edge_buckets", edge_bucket_stats(records)},
    });
  }

  auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
  std::cout << "[backtest] sweep: " << hourly.size() << " hours over " << markets.size() << " markets | "
            << static_cast<int>(ms) << "ms" << std::endl;

  return json{
      {"run_id", new_run_id()},
      {"max_hours", max_hours},
      {"evaluated_at", now_unix()},
      {"total_resolved_markets", static_cast<int64_t>(markets.size())},
      {"hours_evaluated", static_cast<int64_t>(hourly.size())},
      {"hourly_results", hourly},
  };
}

} // namespace backtest
