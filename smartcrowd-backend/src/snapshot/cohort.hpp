#pragma once

// ============================================================================
// Cohort 分类: 按顺序匹配的规则表, 首个命中即返回
// 新增 cohort 时插入 PROFILE_RULES 对应位置, 不改动已有规则
// ============================================================================

#include "../metrics/wallet_metrics.hpp"

#include <cmath>
#include <cstdint>

namespace snapshot {

enum class Cohort : uint8_t {
  NOISE_CHURNER,
  TIMING_SPECIALIST,
  INFORMED_ACCUMULATOR,
  WHALE_CONVICTION,
  CATEGORY_SPECIALIST,
  MAKER_ARB,
  GENERALIST_FLOW,
};

inline const char *cohort_name(Cohort c) {
  switch (c) {
  case Cohort::NOISE_CHURNER:
    return "noise_churner";
  case Cohort::TIMING_SPECIALIST:
    return "timing_specialist";
  case Cohort::INFORMED_ACCUMULATOR:
    return "informed_accumulator";
  case Cohort::WHALE_CONVICTION:
    return "whale_conviction";
  case Cohort::CATEGORY_SPECIALIST:
    return "category_specialist";
  case Cohort::MAKER_ARB:
    return "maker_arb";
  case Cohort::GENERALIST_FLOW:
    return "generalist_flow";
  }
  return "generalist_flow";
}

struct ProfileRule {
  Cohort cohort;
  bool (*matches)(const metrics::WalletMetric &p);
};

// profile = 钱包 (ALL, ALL) 指标行
inline constexpr ProfileRule PROFILE_RULES[] = {
    {Cohort::NOISE_CHURNER, [](const metrics::WalletMetric &p) { return p.churn > 0.65; }},
    {Cohort::TIMING_SPECIALIST,
     [](const metrics::WalletMetric &p) { return p.timing_edge > 0.22 && p.churn < 0.45 && p.sample_markets >= 5; }},
    {Cohort::INFORMED_ACCUMULATOR,
     [](const metrics::WalletMetric &p) {
       return p.persistence > 0.72 && p.specialization > 0.45 && p.sample_markets >= 6;
     }},
    {Cohort::WHALE_CONVICTION, [](const metrics::WalletMetric &p) { return p.avg_trade_size > 200 && p.churn < 0.5; }},
    {Cohort::CATEGORY_SPECIALIST,
     [](const metrics::WalletMetric &p) { return p.brier < 0.20 && p.specialization > 0.40; }},
    {Cohort::MAKER_ARB, [](const metrics::WalletMetric &p) { return p.churn < 0.35 && std::abs(p.roi) < 0.04; }},
};

inline Cohort classify_profile(const metrics::WalletMetric &profile) {
  for (const auto &rule : PROFILE_RULES) {
    if (rule.matches(profile))
      return rule.cohort;
  }
  return Cohort::GENERALIST_FLOW;
}

// 无历史画像: 只看当前信号
inline Cohort classify_signal(double churn, double confidence) {
  if (churn > 0.65)
    return Cohort::NOISE_CHURNER;
  if (confidence > 0.55)
    return Cohort::INFORMED_ACCUMULATOR;
  return Cohort::GENERALIST_FLOW;
}

inline Cohort classify(const metrics::WalletMetric *profile, double signal_churn, double signal_confidence) {
  return profile ? classify_profile(*profile) : classify_signal(signal_churn, signal_confidence);
}

} // namespace snapshot
