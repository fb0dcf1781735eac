#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace belief {

static constexpr double PROB_FLOOR = 0.001;
static constexpr double PROB_CEIL = 0.999;

// ============================================================================
// Trade row: 外部 ingestion 已归一化 (wallet 小写, side/action 大写)
// ============================================================================
enum class Side : uint8_t { YES = 0, NO = 1 };
enum class Action : uint8_t { BUY = 0, SELL = 1 };

struct Trade {
  int64_t ts = 0; // unix seconds
  Side side = Side::YES;
  Action action = Action::BUY;
  double price = 0.0; // [0,1], 所买卖 side 的价格
  double size = 0.0;  // > 0
};

inline std::optional<Side> parse_side(std::string_view s) {
  if (s == "YES")
    return Side::YES;
  if (s == "NO")
    return Side::NO;
  return std::nullopt;
}

inline std::optional<Action> parse_action(std::string_view s) {
  if (s == "BUY")
    return Action::BUY;
  if (s == "SELL")
    return Action::SELL;
  return std::nullopt;
}

inline const char *side_name(Side s) { return s == Side::YES ? "YES" : "NO"; }
inline const char *action_name(Action a) { return a == Action::BUY ? "BUY" : "SELL"; }

// ============================================================================
// BeliefSignal: 单钱包/单市场/单时刻, 不缓存
// ============================================================================
struct BeliefSignal {
  double belief = 0.5;
  double confidence = 0.0;
  int64_t trade_count = 0;
  double churn = 1.0;
  double persistence = 0.0;
  double avg_size = 0.0;
  double net_direction = 0.0;
};

inline double clamp(double v, double lo, double hi) { return std::max(lo, std::min(hi, v)); }

inline double clamp_prob(double p) { return clamp(p, PROB_FLOOR, PROB_CEIL); }

// YES 暴露变化方向: 买 YES / 卖 NO → +1
inline int yes_direction(Side side, Action action) {
  int action_sign = action == Action::BUY ? 1 : -1;
  return side == Side::YES ? action_sign : -action_sign;
}

inline double implied_yes_price(Side side, double price) {
  return clamp_prob(side == Side::YES ? price : 1.0 - price);
}

} // namespace belief
