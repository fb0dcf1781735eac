#pragma once

// ============================================================================
// Wallet Trust Weighting: wallet_metrics → wallet_weights
//
// edge    = 0.25 - brier (0.25 = 常数 0.5 预测的 Brier)
// shrink  = support / (support + prior)   prior: 全局 22, 细分 12
// weight  = base × style × persistence × calibration × specialization
// ============================================================================

#include "../belief/belief_types.hpp"
#include "../core/database.hpp"
#include "../core/schema.hpp"

#include <array>
#include <chrono>
#include <cmath>
#include <duckdb.hpp>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace weights {

using belief::clamp;

static constexpr double BASELINE_BRIER = 0.25;
static constexpr double GLOBAL_PRIOR_STRENGTH = 22.0;
static constexpr double LOCAL_PRIOR_STRENGTH = 12.0;
static constexpr double WEIGHT_MIN = 0.10;
static constexpr double WEIGHT_MAX = 4.00;

// compute_wallet_weight 的输入, 对应 wallet_metrics 一行的子集
struct MetricInput {
  std::string category = schema::ALL;
  std::string horizon_bucket = schema::ALL;
  int64_t support = 0; // sample_markets
  double brier = 0.25;
  double calibration_error = 0.0;
  double churn = 0.0;
  double persistence = 0.0;
  double specialization = 0.0;

  bool is_global() const { return category == schema::ALL && horizon_bucket == schema::ALL; }
};

struct TrustWeight {
  double weight = 1.0;
  double uncertainty = 1.0;
};

// global_edge: 该钱包 (ALL, ALL) 行的 edge, 无全局行时为 0
inline TrustWeight compute_wallet_weight(const MetricInput &m, double global_edge) {
  double support = static_cast<double>(m.support);
  double local_edge = BASELINE_BRIER - m.brier;
  double prior = m.is_global() ? GLOBAL_PRIOR_STRENGTH : LOCAL_PRIOR_STRENGTH;
  double shrink = support / (support + prior);
  double blended_edge = shrink * local_edge + (1.0 - shrink) * global_edge;

  double base_weight = clamp(1.0 + blended_edge / BASELINE_BRIER, 0.20, 3.00);
  double churn = clamp(m.churn, 0.0, 1.0);
  double persistence = clamp(m.persistence, 0.0, 1.0);
  double calibration_error = clamp(m.calibration_error, 0.0, 1.0);
  double specialization = clamp(m.specialization, 0.0, 1.0);

  double style_penalty = std::max(0.45, 1.0 - 0.60 * churn);
  double persistence_boost = 0.85 + 0.30 * persistence;
  double calibration_penalty = std::max(0.50, 1.0 - calibration_error);
  double specialization_boost = 0.90 + 0.20 * specialization;

  TrustWeight w;
  w.weight = clamp(base_weight * style_penalty * persistence_boost * calibration_penalty * specialization_boost,
                   WEIGHT_MIN, WEIGHT_MAX);
  w.uncertainty = clamp(0.9 / std::sqrt(support + 1.0) + 0.4 * calibration_error, 0.0, 1.0);
  return w;
}

struct RecomputeResult {
  int64_t rows_written = 0;
};

// ============================================================================
// 全量重算: 读 wallet_metrics, 事务内重写 wallet_weights
// ============================================================================
inline RecomputeResult recompute_wallet_weights(Database &db) {
  auto t0 = std::chrono::steady_clock::now();
  duckdb::Connection conn(db.get_duckdb());
  auto r = conn.Query("SELECT wallet, category, horizon_bucket, sample_markets, brier, calibration_error, churn, "
                      "persistence, specialization FROM wallet_metrics ORDER BY wallet, category, horizon_bucket");
  if (r->HasError())
    throw std::runtime_error("[weights] query failed: " + r->GetError());

  std::vector<std::pair<std::string, MetricInput>> rows;
  rows.reserve(r->RowCount());
  std::unordered_map<std::string, double> global_edges;
  for (size_t i = 0; i < r->RowCount(); ++i) {
    MetricInput m;
    auto wallet = r->GetValue(0, i).ToString();
    m.category = r->GetValue(1, i).ToString();
    m.horizon_bucket = r->GetValue(2, i).ToString();
    m.support = r->GetValue(3, i).GetValue<int64_t>();
    m.brier = r->GetValue(4, i).GetValue<double>();
    m.calibration_error = r->GetValue(5, i).GetValue<double>();
    m.churn = r->GetValue(6, i).GetValue<double>();
    m.persistence = r->GetValue(7, i).GetValue<double>();
    m.specialization = r->GetValue(8, i).GetValue<double>();
    if (m.is_global())
      global_edges[wallet] = BASELINE_BRIER - m.brier;
    rows.emplace_back(std::move(wallet), std::move(m));
  }

  int64_t updated_at = now_unix();
  std::vector<std::string> values;
  values.reserve(rows.size());
  for (const auto &[wallet, m] : rows) {
    if (m.support <= 0)
      continue;
    auto it = global_edges.find(wallet);
    auto w = compute_wallet_weight(m, it == global_edges.end() ? 0.0 : it->second);
    values.push_back(schema::escape_sql(wallet) + ", " + schema::escape_sql(m.category) + ", " +
                     schema::escape_sql(m.horizon_bucket) + ", " + schema::sql_double(w.weight) + ", " +
                     schema::sql_double(w.uncertainty) + ", " + std::to_string(m.support) + ", " +
                     std::to_string(updated_at));
  }

  Database::Transaction tx(db);
  tx.execute("DELETE FROM wallet_weights");
  tx.batch_insert("wallet_weights", "wallet, category, horizon_bucket, weight, uncertainty, support, updated_at",
                  values);
  tx.commit();

  auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
  std::cout << "[weights] done: " << rows.size() << " metric rows → " << values.size() << " weights | "
            << static_cast<int>(ms) << "ms" << std::endl;
  return {static_cast<int64_t>(values.size())};
}

// ============================================================================
// 级联查找: exact → category → horizon → global → cold-start
// ============================================================================
struct WeightKey {
  std::string wallet;
  std::string category;
  std::string horizon_bucket;

  bool operator<(const WeightKey &o) const {
    return std::tie(wallet, category, horizon_bucket) < std::tie(o.wallet, o.category, o.horizon_bucket);
  }
};

inline std::array<WeightKey, 4> fallback_keys(const std::string &wallet, const std::string &category,
                                              const std::string &horizon_bucket) {
  return {{
      {wallet, category, horizon_bucket},
      {wallet, category, schema::ALL},
      {wallet, schema::ALL, horizon_bucket},
      {wallet, schema::ALL, schema::ALL},
  }};
}

inline constexpr TrustWeight COLD_START{1.0, 1.0};

// 单市场快照内一次性加载相关钱包的全部 weight 行
class WeightLookup {
public:
  WeightLookup() = default;

  void put(const WeightKey &key, TrustWeight w) { table_[key] = w; }

  void load(duckdb::Connection &conn, const std::vector<std::string> &wallets) {
    table_.clear();
    if (wallets.empty())
      return;
    std::string in_list;
    for (size_t i = 0; i < wallets.size(); ++i) {
      if (i > 0)
        in_list += ", ";
      in_list += schema::escape_sql(wallets[i]);
    }
    auto r = conn.Query("SELECT wallet, category, horizon_bucket, weight, uncertainty FROM wallet_weights "
                        "WHERE wallet IN (" + in_list + ")");
    if (r->HasError())
      throw std::runtime_error("[weights] lookup failed: " + r->GetError());
    for (size_t i = 0; i < r->RowCount(); ++i) {
      WeightKey key{r->GetValue(0, i).ToString(), r->GetValue(1, i).ToString(), r->GetValue(2, i).ToString()};
      table_[key] = TrustWeight{r->GetValue(3, i).GetValue<double>(), r->GetValue(4, i).GetValue<double>()};
    }
  }

  TrustWeight find(const std::string &wallet, const std::string &category, const std::string &horizon_bucket) const {
    for (const auto &key : fallback_keys(wallet, category, horizon_bucket)) {
      auto it = table_.find(key);
      if (it != table_.end())
        return it->second;
    }
    return COLD_START;
  }

private:
  std::map<WeightKey, TrustWeight> table_;
};

} // namespace weights
