#pragma once

// ============================================================================
// Market Snapshot Aggregator: 纯函数部分
//
// 输入: 已算好 belief / trust weight / cohort 的钱包信号列表
// 输出: MarketSnapshot (聚合概率 + 诊断 + 解释)
// 不访问数据库, 同样的输入得到完全相同的输出
// ============================================================================

#include "../belief/belief_types.hpp"
#include "../weights/wallet_weights.hpp"
#include "cohort.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace snapshot {

using json = nlohmann::json;
using belief::clamp;

static constexpr size_t TOP_DRIVERS = 8;
static constexpr size_t TOP_COHORTS = 8;
static constexpr double SIGNAL_SUPPORT_SCALE = 10.0;
static constexpr double WALLET_COUNT_SATURATION = 15.0;
static constexpr double EFFECTIVE_N_SATURATION = 12.0;
static constexpr size_t THIN_SAMPLE_WALLETS = 3;
static constexpr double THIN_SAMPLE_PENALTY = 0.60;

inline double round6(double v) { return std::round(v * 1e6) / 1e6; }

inline std::string format_fixed(double v, int digits) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", digits, v);
  return buf;
}

// ============================================================================
// 单钱包信号
// ============================================================================
struct WalletSignal {
  std::string wallet;
  double belief = 0.5;
  double confidence = 0.0;
  double churn = 1.0;
  double trust_weight = 0.0;     // weight × anti_noise × uncertainty_discount
  double effective_weight = 0.0; // trust_weight × confidence
  Cohort cohort = Cohort::GENERALIST_FLOW;
};

// confidence 或 effective_weight 非正时返回 nullopt
inline std::optional<WalletSignal> make_wallet_signal(const std::string &wallet, const belief::BeliefSignal &sig,
                                                      const weights::TrustWeight &tw, Cohort cohort) {
  if (sig.confidence <= 0.0)
    return std::nullopt;
  double anti_noise = std::max(0.40, 1.0 - 0.55 * sig.churn) * (0.85 + 0.30 * sig.persistence);
  double uncertainty_discount = std::max(0.40, 1.0 - 0.30 * tw.uncertainty);

  WalletSignal s;
  s.wallet = wallet;
  s.belief = sig.belief;
  s.confidence = sig.confidence;
  s.churn = sig.churn;
  s.trust_weight = tw.weight * anti_noise * uncertainty_discount;
  s.effective_weight = s.trust_weight * sig.confidence;
  s.cohort = cohort;
  if (s.effective_weight <= 0.0)
    return std::nullopt;
  return s;
}

// ============================================================================
// 快照
// ============================================================================
struct MarketSnapshot {
  std::string market_id;
  int64_t snapshot_time = 0;
  double market_prob = 0.5;
  double aggregate_prob = 0.5;
  double divergence = 0.0;
  double confidence = 0.0;
  double disagreement = 0.0;
  double participation_quality = 0.0;
  double integrity_risk = 1.0;
  int64_t active_wallets = 0;
  json top_drivers = json::array();
  json cohort_summary = json::array();
  json flip_conditions = json::array();
  json explanation = json::object();

  json to_json() const {
    return json{
        {"market_id", market_id},
        {"snapshot_time", snapshot_time},
        {"market_prob", market_prob},
        {"smartcrowd_prob", aggregate_prob},
        {"divergence", divergence},
        {"confidence", confidence},
        {"disagreement", disagreement},
        {"participation_quality", participation_quality},
        {"integrity_risk", integrity_risk},
        {"active_wallets", active_wallets},
        {"top_drivers", top_drivers},
        {"cohort_summary", cohort_summary},
        {"flip_conditions", flip_conditions},
        {"explanation", explanation},
    };
  }
};

// ============================================================================
// Cohort 汇总
// ============================================================================
inline json summarize_cohorts(const std::vector<WalletSignal> &signals, double market_prob, double denominator) {
  struct Accum {
    std::set<std::string> wallets;
    double effective_weight = 0.0;
    double belief_mass = 0.0;
    double confidence_mass = 0.0;
    double net_contribution = 0.0;
  };
  std::map<Cohort, Accum> accum;
  for (const auto &s : signals) {
    auto &a = accum[s.cohort];
    a.wallets.insert(s.wallet);
    a.effective_weight += s.effective_weight;
    a.belief_mass += s.effective_weight * s.belief;
    a.confidence_mass += s.effective_weight * s.confidence;
    a.net_contribution += s.effective_weight * (s.belief - market_prob);
  }

  std::vector<json> rows;
  for (const auto &[cohort, a] : accum) {
    double ew = std::max(a.effective_weight, 1e-9);
    rows.push_back(json{
        {"cohort", cohort_name(cohort)},
        {"wallet_count", static_cast<int64_t>(a.wallets.size())},
        {"weight_share", round6(a.effective_weight / std::max(denominator, 1e-9))},
        {"avg_belief", round6(a.belief_mass / ew)},
        {"avg_confidence", round6(a.confidence_mass / ew)},
        {"net_contribution", round6(a.net_contribution)},
    });
  }
  std::stable_sort(rows.begin(), rows.end(), [](const json &a, const json &b) {
    return std::abs(a["net_contribution"].get<double>()) > std::abs(b["net_contribution"].get<double>());
  });
  if (rows.size() > TOP_COHORTS)
    rows.resize(TOP_COHORTS);

  json out = json::array();
  for (auto &r : rows)
    out.push_back(std::move(r));
  return out;
}

// ============================================================================
// Flip conditions (近似值): 假设新增反向权重的 belief 可达 0 或 1
// ============================================================================
inline json build_flip_conditions(double market_prob, double aggregate_prob, double denominator, double divergence,
                                  const json &cohort_summary) {
  json out = json::array();
  if (std::abs(divergence) < 1e-12 || denominator <= 0.0) {
    out.push_back(json{
        {"condition", "signal_aligned_with_market"},
        {"detail", "SmartCrowd is currently aligned with market implied probability."},
    });
    return out;
  }

  if (divergence > 0.0) {
    if (market_prob > 0.0) {
      double needed = denominator * (aggregate_prob - market_prob) / market_prob;
      out.push_back(json{
          {"condition", "trusted_no_flow_needed"},
          {"detail", "Approximately " + format_fixed(needed, 3) +
                         " additional effective NO-side weight at extreme conviction is needed to cross below market."},
          {"required_effective_weight", std::max(0.0, needed)},
      });
    }
  } else if (market_prob < 1.0) {
    double needed = denominator * (market_prob - aggregate_prob) / (1.0 - market_prob);
    out.push_back(json{
        {"condition", "trusted_yes_flow_needed"},
        {"detail", "Approximately " + format_fixed(needed, 3) +
                       " additional effective YES-side weight at extreme conviction is needed to cross above market."},
        {"required_effective_weight", std::max(0.0, needed)},
    });
  }

  if (!cohort_summary.empty()) {
    const auto &lead = cohort_summary.front();
    auto lead_name = lead["cohort"].get<std::string>();
    out.push_back(json{
        {"condition", "lead_cohort_reversal"},
        {"detail", "If leading cohort '" + lead_name +
                       "' reverses direction or halves conviction, the SmartCrowd divergence would compress "
                       "materially."},
        {"lead_cohort", lead_name},
        {"lead_cohort_net_contribution", lead["net_contribution"]},
    });
  }
  return out;
}

// ============================================================================
// 聚合主流程
// ============================================================================
inline MarketSnapshot aggregate(const std::string &market_id, int64_t snapshot_time, double market_prob,
                                const std::vector<WalletSignal> &signals) {
  MarketSnapshot snap;
  snap.market_id = market_id;
  snap.snapshot_time = snapshot_time;
  snap.market_prob = market_prob;

  double denominator = 0.0;
  for (const auto &s : signals)
    denominator += s.effective_weight;

  // 无有效信号: 退化为市场价, 不是错误
  if (signals.empty() || denominator <= 0.0) {
    snap.aggregate_prob = market_prob;
    snap.explanation = json{
        {"summary", "No qualifying trusted wallets with confidence above zero for this snapshot."},
        {"diagnostics", json::object()},
        {"evidence", json::object()},
    };
    return snap;
  }

  double weighted_belief = 0.0;
  for (const auto &s : signals)
    weighted_belief += s.effective_weight * s.belief;
  double agg = belief::clamp_prob(weighted_belief / std::max(denominator, 1e-9));

  double variance = 0.0;
  double herfindahl = 0.0;
  double avg_churn = 0.0;
  for (const auto &s : signals) {
    double share = s.effective_weight / denominator;
    variance += share * (s.belief - agg) * (s.belief - agg);
    herfindahl += share * share;
    avg_churn += share * s.churn;
  }
  double disagreement = clamp(std::sqrt(variance), 0.0, 1.0);
  double effective_n = 1.0 / std::max(herfindahl, 1e-9);
  double participation_quality = clamp(effective_n / EFFECTIVE_N_SATURATION, 0.0, 1.0);
  double integrity_risk = clamp(0.55 * herfindahl + 0.45 * avg_churn, 0.0, 1.0);

  double signal_support = denominator / (denominator + SIGNAL_SUPPORT_SCALE);
  double agreement = std::max(0.0, 1.0 - disagreement);
  double wallet_count_factor = std::min(1.0, static_cast<double>(signals.size()) / WALLET_COUNT_SATURATION);
  double confidence =
      clamp(signal_support * agreement * wallet_count_factor * (1.0 - 0.70 * integrity_risk), 0.0, 1.0);
  if (signals.size() < THIN_SAMPLE_WALLETS)
    confidence *= THIN_SAMPLE_PENALTY;

  snap.aggregate_prob = agg;
  snap.divergence = agg - market_prob;
  snap.confidence = confidence;
  snap.disagreement = disagreement;
  snap.participation_quality = participation_quality;
  snap.integrity_risk = integrity_risk;
  snap.active_wallets = static_cast<int64_t>(signals.size());

  // top drivers: |effective × (belief - market)|
  std::vector<json> drivers;
  drivers.reserve(signals.size());
  for (const auto &s : signals) {
    drivers.push_back(json{
        {"wallet", s.wallet},
        {"belief", round6(s.belief)},
        {"confidence", round6(s.confidence)},
        {"weight", round6(s.trust_weight)},
        {"contribution", round6(s.effective_weight * (s.belief - market_prob))},
    });
  }
  std::stable_sort(drivers.begin(), drivers.end(), [](const json &a, const json &b) {
    return std::abs(a["contribution"].get<double>()) > std::abs(b["contribution"].get<double>());
  });
  if (drivers.size() > TOP_DRIVERS)
    drivers.resize(TOP_DRIVERS);
  for (auto &d : drivers)
    snap.top_drivers.push_back(std::move(d));

  snap.cohort_summary = summarize_cohorts(signals, market_prob, denominator);
  snap.flip_conditions = build_flip_conditions(market_prob, agg, denominator, snap.divergence, snap.cohort_summary);

  const char *directional = snap.divergence > 0 ? "YES-leaning" : (snap.divergence < 0 ? "NO-leaning" : "neutral");
  snap.explanation = json{
      {"summary", "SmartCrowd is " + format_fixed(agg, 3) + " vs market " + format_fixed(market_prob, 3) + " (" +
                      directional + "), confidence " + format_fixed(confidence, 2) + ", disagreement " +
                      format_fixed(disagreement, 3) + ", integrity risk " + format_fixed(integrity_risk, 3) + "."},
      {"diagnostics",
       {
           {"denominator", round6(denominator)},
           {"wallet_count", snap.active_wallets},
           {"confidence", round6(confidence)},
           {"disagreement", round6(disagreement)},
           {"integrity_risk", round6(integrity_risk)},
       }},
      {"evidence",
       {
           {"top_cohorts", snap.cohort_summary},
           {"flip_conditions", snap.flip_conditions},
       }},
  };
  return snap;
}

} // namespace snapshot
