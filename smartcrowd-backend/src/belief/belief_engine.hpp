#pragma once

// ============================================================================
// Belief Inference: 从单钱包在单市场的交易序列推断 YES 概率
//
// vote    = 方向加权的隐含 YES 价格 (买方向 → 向 1 推, 卖方向 → 向 0 推)
// weight  = sqrt(size) × 时间衰减 × 连续同向加成
// churn   = 方向反转次数 / (n-1)
// ============================================================================

#include "belief_types.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

#define BELIEF_DEFAULT_HALF_LIFE_HOURS 48.0

namespace belief {

static constexpr double SIGNAL_MASS_SCALE = 6.0;    // 总权重饱和尺度
static constexpr double SAMPLE_SUPPORT_TRADES = 6.0; // 交易数饱和尺度
static constexpr double STREAK_STEP = 0.12;
static constexpr int STREAK_CAP = 4; // 最多 +48%

inline double recency_factor(double age_hours, double half_life_hours) {
  age_hours = std::max(0.0, age_hours);
  return std::exp(-std::log(2.0) * age_hours / std::max(half_life_hours, 1e-6));
}

inline double persistence_boost(int streak) {
  return 1.0 + STREAK_STEP * std::min(streak - 1, STREAK_CAP);
}

// 异常行 (越界 price / 非正 size / NaN) 直接跳过, 不抛异常
inline bool is_well_formed(const Trade &t) {
  return std::isfinite(t.price) && std::isfinite(t.size) && t.price >= 0.0 && t.price <= 1.0 && t.size > 0.0;
}

inline double trade_vote(const Trade &t) {
  double yes_px = implied_yes_price(t.side, t.price);
  return yes_direction(t.side, t.action) > 0 ? (yes_px + 1.0) / 2.0 : yes_px / 2.0;
}

// as_of 缺省时取最后一笔交易时间
inline BeliefSignal infer_belief(std::vector<Trade> trades, std::optional<int64_t> as_of = std::nullopt,
                                 double half_life_hours = BELIEF_DEFAULT_HALF_LIFE_HOURS) {
  std::stable_sort(trades.begin(), trades.end(),
                   [](const Trade &a, const Trade &b) { return a.ts < b.ts; });
  if (trades.empty())
    return BeliefSignal{};

  int64_t cutoff = as_of ? *as_of : trades.back().ts;

  double weighted_belief = 0.0;
  double total_weight = 0.0;
  double weighted_direction = 0.0;
  double total_size = 0.0;
  int flips = 0;
  int prev_direction = 0; // 0 = 尚无
  int streak = 0;
  int64_t considered = 0;

  for (const auto &t : trades) {
    if (t.ts > cutoff)
      break;
    if (!is_well_formed(t))
      continue;

    int direction = yes_direction(t.side, t.action);
    if (prev_direction == 0 || prev_direction != direction) {
      if (prev_direction != 0)
        ++flips;
      streak = 1;
    } else {
      ++streak;
    }
    prev_direction = direction;

    double age_hours = static_cast<double>(cutoff - t.ts) / 3600.0;
    double weight = std::sqrt(std::max(t.size, 1e-9)) * recency_factor(age_hours, half_life_hours) *
                    persistence_boost(streak);

    weighted_belief += weight * trade_vote(t);
    total_weight += weight;
    weighted_direction += weight * direction;
    total_size += t.size;
    ++considered;
  }

  if (considered == 0 || total_weight <= 0.0)
    return BeliefSignal{};

  BeliefSignal s;
  s.belief = clamp_prob(weighted_belief / total_weight);
  s.trade_count = considered;
  s.churn = static_cast<double>(flips) / static_cast<double>(std::max<int64_t>(1, considered - 1));
  s.persistence = 1.0 - s.churn;
  s.avg_size = total_size / static_cast<double>(considered);
  s.net_direction = weighted_direction / total_weight;

  double signal_mass = total_weight / (total_weight + SIGNAL_MASS_SCALE);
  double sample_support = 0.3 + 0.7 * std::min(1.0, static_cast<double>(considered) / SAMPLE_SUPPORT_TRADES);
  s.confidence = clamp(signal_mass * sample_support * (0.5 + 0.5 * s.persistence), 0.0, 1.0);
  return s;
}

} // namespace belief
