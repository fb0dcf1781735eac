#pragma once

// ============================================================================
// Wallet Performance Metrics: 全量重算
//
// Step 1: load_final_yes(): 每个已结算市场结算前最后成交的隐含 YES 价格
// Step 2: load_specialization(): 钱包在各 category 的市场数 → 归一化熵
// Step 3: 流式扫描 trades (market, wallet, ts 排序), 逐 (market, wallet) 组打分
// Step 4: 事务内 DELETE + INSERT wallet_metrics
// ============================================================================

#include "../belief/belief_engine.hpp"
#include "../core/database.hpp"
#include "../core/schema.hpp"
#include "../store/trade_store.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <duckdb.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace metrics {

static constexpr double TIMING_NOISE = 0.005; // 价格变动小于 0.5% 视为噪声

// ============================================================================
// Horizon bucket: end_time - ref_time
// ============================================================================
inline const char *horizon_bucket(int64_t end_time, int64_t ref_time) {
  double delta_hours = static_cast<double>(end_time - ref_time) / 3600.0;
  if (delta_hours <= 24)
    return "intraday";
  if (delta_hours <= 7 * 24)
    return "short";
  if (delta_hours <= 30 * 24)
    return "medium";
  return "long";
}

inline double safe_log_loss(double prob, int outcome) {
  double p = belief::clamp_prob(prob);
  return -(outcome * std::log(p) + (1 - outcome) * std::log(1.0 - p));
}

// 1 - H / ln(k); 单一 category 为 1.0
inline double specialization(const std::map<std::string, int64_t> &category_counts) {
  int64_t total = 0;
  for (const auto &[cat, c] : category_counts)
    total += c;
  if (total == 0 || category_counts.size() <= 1)
    return 1.0;
  double entropy = 0.0;
  for (const auto &[cat, c] : category_counts) {
    if (c <= 0)
      continue;
    double p = static_cast<double>(c) / static_cast<double>(total);
    entropy -= p * std::log(p);
  }
  double max_entropy = std::log(static_cast<double>(category_counts.size()));
  return 1.0 - (max_entropy > 0 ? entropy / max_entropy : 0.0);
}

// ============================================================================
// 单钱包单市场打分
// ============================================================================
struct WalletMarketScore {
  double belief = 0.5;
  double brier = 0.0;
  double log_loss = 0.0;
  double churn = 1.0;
  double persistence = 0.0;
  double timing_edge = 0.0;
  double pnl = 0.0;
  double cost = 0.0;
  double total_size = 0.0;
  int64_t trade_count = 0;
};

// trades 为该钱包在该市场的全部合法交易 (时间序)
inline WalletMarketScore score_wallet_market(const std::vector<belief::Trade> &trades, int outcome,
                                             int64_t cutoff, std::optional<double> final_yes,
                                             double half_life_hours) {
  WalletMarketScore s;
  auto sig = belief::infer_belief(trades, cutoff, half_life_hours);
  s.belief = sig.belief;
  s.churn = sig.churn;
  s.persistence = sig.persistence;
  s.brier = (s.belief - outcome) * (s.belief - outcome);
  s.log_loss = safe_log_loss(s.belief, outcome);

  int64_t timing_hits = 0;
  int64_t timing_total = 0;
  for (const auto &t : trades) {
    int direction = belief::yes_direction(t.side, t.action);
    if (final_yes) {
      double move = *final_yes - belief::implied_yes_price(t.side, t.price);
      if (std::abs(move) > TIMING_NOISE) {
        ++timing_total;
        if (direction * move > 0)
          ++timing_hits;
      }
    }

    // mark-to-resolution: token 价值 = outcome (YES) / 1-outcome (NO)
    double token_value = t.side == belief::Side::YES ? outcome : 1 - outcome;
    if (t.action == belief::Action::BUY)
      s.pnl += (token_value - t.price) * t.size;
    else
      s.pnl += (t.price - token_value) * t.size;
    s.cost += std::max(t.price * t.size, 1e-9);
    s.total_size += t.size;
  }
  if (timing_total > 0)
    s.timing_edge = 2.0 * static_cast<double>(timing_hits) / static_cast<double>(timing_total) - 1.0;
  s.trade_count = static_cast<int64_t>(trades.size());
  return s;
}

// ============================================================================
// 分组累加
// ============================================================================
struct MetricAccum {
  int64_t market_count = 0;
  int64_t trade_count = 0;
  double sum_brier = 0.0;
  double sum_log_loss = 0.0;
  double sum_belief = 0.0;
  double sum_outcome = 0.0;
  double sum_trade_size = 0.0;
  double sum_churn = 0.0;
  double sum_persistence = 0.0;
  double sum_timing_edge = 0.0;
  double sum_pnl = 0.0;
  double sum_cost = 0.0;

  void add(const WalletMarketScore &s, int outcome) {
    ++market_count;
    trade_count += s.trade_count;
    sum_brier += s.brier;
    sum_log_loss += s.log_loss;
    sum_belief += s.belief;
    sum_outcome += outcome;
    sum_trade_size += s.total_size;
    sum_churn += s.churn;
    sum_persistence += s.persistence;
    sum_timing_edge += s.timing_edge;
    sum_pnl += s.pnl;
    sum_cost += s.cost;
  }
};

struct WalletMetric {
  std::string wallet;
  std::string category;
  std::string horizon_bucket;
  int64_t sample_markets = 0;
  int64_t sample_trades = 0;
  double brier = 0.0;
  double log_loss = 0.0;
  double roi = 0.0;
  double calibration_error = 0.0;
  double avg_trade_size = 0.0;
  double churn = 0.0;
  double persistence = 0.0;
  double specialization = 0.0;
  double timing_edge = 0.0;
};

inline WalletMetric finalize(const std::string &wallet, const std::string &category, const std::string &horizon,
                             const MetricAccum &a, double spec) {
  double n = static_cast<double>(a.market_count);
  WalletMetric m;
  m.wallet = wallet;
  m.category = category;
  m.horizon_bucket = horizon;
  m.sample_markets = a.market_count;
  m.sample_trades = a.trade_count;
  m.brier = a.sum_brier / n;
  m.log_loss = a.sum_log_loss / n;
  m.calibration_error = std::abs(a.sum_belief / n - a.sum_outcome / n);
  m.roi = a.sum_pnl / std::max(a.sum_cost, 1e-9);
  m.avg_trade_size = a.sum_trade_size / static_cast<double>(a.trade_count);
  m.churn = a.sum_churn / n;
  m.persistence = a.sum_persistence / n;
  m.timing_edge = a.sum_timing_edge / n;
  m.specialization = spec;
  return m;
}

struct RecomputeResult {
  int64_t rows_written = 0;
};

// ============================================================================
// 全量重算入口
// ============================================================================
class MetricsBuilder {
public:
  MetricsBuilder(Database &db, double half_life_hours) : db_(db), half_life_hours_(half_life_hours) {}

  RecomputeResult run() {
    auto t0 = clock::now();
    auto conn = std::make_unique<duckdb::Connection>(db_.get_duckdb());

    load_final_yes(*conn);
    load_specialization(*conn);
    scan_groups(*conn);

    std::vector<WalletMetric> rows;
    rows.reserve(accums_.size());
    for (const auto &[key, a] : accums_) {
      const auto &[wallet, category, horizon] = key;
      if (a.market_count == 0 || a.trade_count == 0)
        continue;
      auto it = specialization_.find(wallet);
      rows.push_back(finalize(wallet, category, horizon, a, it == specialization_.end() ? 0.0 : it->second));
    }

    write(rows);

    std::cout << "[metrics] done: " << groups_ << " wallet-markets → " << rows.size() << " rows | "
              << static_cast<int>(ms_since(t0)) << "ms" << std::endl;
    return {static_cast<int64_t>(rows.size())};
  }

private:
  using clock = std::chrono::steady_clock;
  using GroupKey = std::tuple<std::string, std::string, std::string>; // wallet, category, horizon

  static double ms_since(clock::time_point t) {
    return std::chrono::duration<double, std::milli>(clock::now() - t).count();
  }

  static duckdb::unique_ptr<duckdb::MaterializedQueryResult> query(duckdb::Connection &conn,
                                                                   const std::string &sql) {
    auto r = conn.Query(sql);
    if (r->HasError())
      throw std::runtime_error("[metrics] query failed: " + r->GetError());
    return r;
  }

  void load_final_yes(duckdb::Connection &conn) {
    auto r = query(conn, std::string(
        "SELECT market_id, side, price FROM ("
        "  SELECT t.market_id, t.side, t.price, "
        "    ROW_NUMBER() OVER (PARTITION BY t.market_id ORDER BY t.ts DESC, t.id DESC) AS rn "
        "  FROM trades t JOIN outcomes o ON o.market_id = t.market_id "
        "  WHERE t.ts <= o.resolution_time AND ") + store::VALID_TRADE_SQL +
        ") WHERE rn = 1");
    final_yes_.clear();
    for (size_t i = 0; i < r->RowCount(); ++i) {
      auto side = belief::parse_side(r->GetValue(1, i).ToString());
      final_yes_[r->GetValue(0, i).ToString()] =
          belief::implied_yes_price(*side, r->GetValue(2, i).GetValue<double>());
    }
  }

  void load_specialization(duckdb::Connection &conn) {
    auto r = query(conn,
                   "SELECT t.wallet, m.category, COUNT(DISTINCT t.market_id) "
                   "FROM trades t "
                   "JOIN markets m ON m.id = t.market_id "
                   "JOIN outcomes o ON o.market_id = t.market_id "
                   "GROUP BY t.wallet, m.category");
    std::unordered_map<std::string, std::map<std::string, int64_t>> counts;
    for (size_t i = 0; i < r->RowCount(); ++i) {
      auto wallet = r->GetValue(0, i).ToString();
      auto category = store::normalize_category(r->GetValue(1, i).ToString());
      counts[wallet][category] += r->GetValue(2, i).GetValue<int64_t>();
    }
    specialization_.clear();
    for (const auto &[wallet, c] : counts)
      specialization_[wallet] = specialization(c);
  }

  // 按 (market, wallet, ts) 流式读取, 内存中只保留当前组
  void scan_groups(duckdb::Connection &conn) {
    accums_.clear();
    groups_ = 0;

    auto result = conn.SendQuery(
        "SELECT t.market_id, t.wallet, t.ts, t.side, t.action, t.price, t.size, "
        "       m.category, m.end_time, o.resolved_outcome, o.resolution_time "
        "FROM trades t "
        "JOIN markets m ON m.id = t.market_id "
        "JOIN outcomes o ON o.market_id = t.market_id "
        "ORDER BY t.market_id, t.wallet, t.ts, t.id");
    if (result->HasError())
      throw std::runtime_error("[metrics] scan failed: " + result->GetError());

    Group group;
    duckdb::unique_ptr<duckdb::DataChunk> chunk;
    while ((chunk = result->Fetch()) != nullptr && chunk->size() > 0) {
      chunk->Flatten();
      auto count = chunk->size();
      auto market = duckdb::FlatVector::GetData<duckdb::string_t>(chunk->data[0]);
      auto wallet = duckdb::FlatVector::GetData<duckdb::string_t>(chunk->data[1]);
      auto ts = duckdb::FlatVector::GetData<int64_t>(chunk->data[2]);
      auto side = duckdb::FlatVector::GetData<duckdb::string_t>(chunk->data[3]);
      auto action = duckdb::FlatVector::GetData<duckdb::string_t>(chunk->data[4]);
      auto price = duckdb::FlatVector::GetData<double>(chunk->data[5]);
      auto size = duckdb::FlatVector::GetData<double>(chunk->data[6]);
      auto category = duckdb::FlatVector::GetData<duckdb::string_t>(chunk->data[7]);
      auto end_time = duckdb::FlatVector::GetData<int64_t>(chunk->data[8]);
      auto outcome = duckdb::FlatVector::GetData<int32_t>(chunk->data[9]);
      auto resolution_time = duckdb::FlatVector::GetData<int64_t>(chunk->data[10]);

      for (duckdb::idx_t i = 0; i < count; ++i) {
        std::string market_id(market[i].GetData(), market[i].GetSize());
        std::string wallet_id(wallet[i].GetData(), wallet[i].GetSize());
        if (market_id != group.market_id || wallet_id != group.wallet) {
          flush(group);
          group = Group{};
          group.market_id = std::move(market_id);
          group.wallet = std::move(wallet_id);
          group.category = store::normalize_category(std::string(category[i].GetData(), category[i].GetSize()));
          group.end_time = end_time[i];
          group.resolution_time = resolution_time[i];
          group.outcome = outcome[i] != 0 ? 1 : 0;
        }

        auto s = belief::parse_side(std::string_view(side[i].GetData(), side[i].GetSize()));
        auto a = belief::parse_action(std::string_view(action[i].GetData(), action[i].GetSize()));
        if (!s || !a)
          continue;
        belief::Trade t{ts[i], *s, *a, price[i], size[i]};
        if (!belief::is_well_formed(t))
          continue;
        group.trades.push_back(t);
      }
    }
    flush(group);
  }

  struct Group {
    std::string market_id;
    std::string wallet;
    std::string category;
    int64_t end_time = 0;
    int64_t resolution_time = 0;
    int outcome = 0;
    std::vector<belief::Trade> trades;
  };

  void flush(const Group &g) {
    if (g.trades.empty())
      return;
    ++groups_;

    int64_t cutoff = std::min(g.end_time, g.resolution_time);
    std::optional<double> final_yes;
    if (auto it = final_yes_.find(g.market_id); it != final_yes_.end())
      final_yes = it->second;

    auto score = score_wallet_market(g.trades, g.outcome, cutoff, final_yes, half_life_hours_);
    const char *horizon = horizon_bucket(g.end_time, g.trades.front().ts);

    accums_[{g.wallet, schema::ALL, schema::ALL}].add(score, g.outcome);
    accums_[{g.wallet, g.category, schema::ALL}].add(score, g.outcome);
    accums_[{g.wallet, schema::ALL, horizon}].add(score, g.outcome);
    accums_[{g.wallet, g.category, horizon}].add(score, g.outcome);
  }

  void write(const std::vector<WalletMetric> &rows) {
    int64_t updated_at = now_unix();
    std::vector<std::string> values;
    values.reserve(rows.size());
    for (const auto &m : rows) {
      values.push_back(schema::escape_sql(m.wallet) + ", " + schema::escape_sql(m.category) + ", " +
                       schema::escape_sql(m.horizon_bucket) + ", " + std::to_string(m.sample_markets) + ", " +
                       std::to_string(m.sample_trades) + ", " + schema::sql_double(m.brier) + ", " +
                       schema::sql_double(m.log_loss) + ", " + schema::sql_double(m.roi) + ", " +
                       schema::sql_double(m.calibration_error) + ", " + schema::sql_double(m.avg_trade_size) + ", " +
                       schema::sql_double(m.churn) + ", " + schema::sql_double(m.persistence) + ", " +
                       schema::sql_double(m.specialization) + ", " + schema::sql_double(m.timing_edge) + ", " +
                       std::to_string(updated_at));
    }

    Database::Transaction tx(db_);
    tx.execute("DELETE FROM wallet_metrics");
    tx.batch_insert("wallet_metrics",
                    "wallet, category, horizon_bucket, sample_markets, sample_trades, brier, log_loss, roi, "
                    "calibration_error, avg_trade_size, churn, persistence, specialization, timing_edge, updated_at",
                    values);
    tx.commit();
  }

  Database &db_;
  double half_life_hours_;

  std::unordered_map<std::string, double> final_yes_;      // market_id → final YES px
  std::unordered_map<std::string, double> specialization_; // wallet → specialization
  std::map<GroupKey, MetricAccum> accums_;
  int64_t groups_ = 0;
};

inline RecomputeResult recompute_wallet_metrics(Database &db,
                                                double half_life_hours = BELIEF_DEFAULT_HALF_LIFE_HOURS) {
  return MetricsBuilder(db, half_life_hours).run();
}

// ============================================================================
// 读取 (ALL, ALL) 画像, 供 cohort 分类
// ============================================================================
inline std::unordered_map<std::string, WalletMetric> load_global_profiles(duckdb::Connection &conn,
                                                                           const std::vector<std::string> &wallets) {
  std::unordered_map<std::string, WalletMetric> out;
  if (wallets.empty())
    return out;

  std::string in_list;
  for (size_t i = 0; i < wallets.size(); ++i) {
    if (i > 0)
      in_list += ", ";
    in_list += schema::escape_sql(wallets[i]);
  }
  auto r = conn.Query(
      "SELECT wallet, sample_markets, sample_trades, brier, log_loss, roi, calibration_error, avg_trade_size, "
      "churn, persistence, specialization, timing_edge FROM wallet_metrics "
      "WHERE category = 'ALL' AND horizon_bucket = 'ALL' AND wallet IN (" +
      in_list + ")");
  if (r->HasError())
    throw std::runtime_error("[metrics] profile query failed: " + r->GetError());

  for (size_t i = 0; i < r->RowCount(); ++i) {
    WalletMetric m;
    m.wallet = r->GetValue(0, i).ToString();
    m.category = schema::ALL;
    m.horizon_bucket = schema::ALL;
    m.sample_markets = r->GetValue(1, i).GetValue<int64_t>();
    m.sample_trades = r->GetValue(2, i).GetValue<int64_t>();
    m.brier = r->GetValue(3, i).GetValue<double>();
    m.log_loss = r->GetValue(4, i).GetValue<double>();
    m.roi = r->GetValue(5, i).GetValue<double>();
    m.calibration_error = r->GetValue(6, i).GetValue<double>();
    m.avg_trade_size = r->GetValue(7, i).GetValue<double>();
    m.churn = r->GetValue(8, i).GetValue<double>();
    m.persistence = r->GetValue(9, i).GetValue<double>();
    m.specialization = r->GetValue(10, i).GetValue<double>();
    m.timing_edge = r->GetValue(11, i).GetValue<double>();
    out[m.wallet] = m;
  }
  return out;
}

} // namespace metrics
