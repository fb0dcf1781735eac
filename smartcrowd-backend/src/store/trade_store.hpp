#pragma once

// ============================================================================
// TradeStore: markets / trades / outcomes 的只读访问
// 每个实例独占一个 duckdb::Connection, worker 线程各自持有一个实例
// ============================================================================

#include "../belief/belief_types.hpp"
#include "../core/schema.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <duckdb.hpp>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace store {

struct Market {
  std::string id;
  std::string question;
  std::string category; // 小写, 空则 "unknown"
  int64_t end_time = 0;
  double liquidity = 0.0;
};

struct ResolvedMarket {
  std::string id;
  int64_t end_time = 0;
  int64_t resolution_time = 0;
  int outcome = 0;

  int64_t close_time() const { return std::min(end_time, resolution_time); }
};

// wallet → 按时间排序的交易, std::map 保证遍历顺序确定
using WalletTrades = std::map<std::string, std::vector<belief::Trade>>;

inline std::string normalize_category(std::string c) {
  for (auto &ch : c)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return c.empty() ? "unknown" : c;
}

// 合法行过滤 (与 belief::is_well_formed 一致)
inline constexpr const char *VALID_TRADE_SQL =
    "isfinite(price) AND isfinite(size) AND price >= 0 AND price <= 1 AND size > 0 "
    "AND side IN ('YES', 'NO') AND action IN ('BUY', 'SELL')";

class TradeStore {
public:
  explicit TradeStore(duckdb::DuckDB &db) : conn_(std::make_unique<duckdb::Connection>(db)) {}

  std::optional<Market> find_market(const std::string &market_id) {
    auto r = query("SELECT id, question, category, end_time, liquidity FROM markets WHERE id = " +
                   schema::escape_sql(market_id));
    if (r->RowCount() == 0)
      return std::nullopt;
    Market m;
    m.id = r->GetValue(0, 0).ToString();
    m.question = r->GetValue(1, 0).ToString();
    m.category = normalize_category(r->GetValue(2, 0).ToString());
    m.end_time = r->GetValue(3, 0).GetValue<int64_t>();
    m.liquidity = r->GetValue(4, 0).GetValue<double>();
    return m;
  }

  std::optional<ResolvedMarket> find_outcome(const std::string &market_id) {
    auto r = query(
        "SELECT m.id, m.end_time, o.resolution_time, o.resolved_outcome "
        "FROM markets m JOIN outcomes o ON o.market_id = m.id WHERE m.id = " +
        schema::escape_sql(market_id));
    if (r->RowCount() == 0)
      return std::nullopt;
    return read_resolved(*r, 0);
  }

  // 已结算市场, 按 id 排序
  std::vector<ResolvedMarket> resolved_markets() {
    auto r = query(
        "SELECT m.id, m.end_time, o.resolution_time, o.resolved_outcome "
        "FROM markets m JOIN outcomes o ON o.market_id = m.id ORDER BY m.id");
    std::vector<ResolvedMarket> out;
    out.reserve(r->RowCount());
    for (size_t i = 0; i < r->RowCount(); ++i)
      out.push_back(read_resolved(*r, i));
    return out;
  }

  // 有交易的市场; include_resolved=false 时排除已结算
  std::vector<std::string> market_ids_with_trades(bool include_resolved) {
    std::string sql =
        "SELECT DISTINCT m.id FROM markets m JOIN trades t ON t.market_id = m.id ";
    if (!include_resolved)
      sql += "LEFT JOIN outcomes o ON o.market_id = m.id WHERE o.market_id IS NULL ";
    sql += "ORDER BY m.id";
    auto r = query(sql);
    std::vector<std::string> ids;
    ids.reserve(r->RowCount());
    for (size_t i = 0; i < r->RowCount(); ++i)
      ids.push_back(r->GetValue(0, i).ToString());
    return ids;
  }

  // 截至 as_of (含) 的全部交易, 按 wallet 分组
  WalletTrades wallet_trades(const std::string &market_id, std::optional<int64_t> as_of) {
    std::string sql = "SELECT wallet, ts, side, action, price, size FROM trades WHERE market_id = " +
                      schema::escape_sql(market_id);
    if (as_of)
      sql += " AND ts <= " + std::to_string(*as_of);
    sql += " ORDER BY wallet, ts, id";
    auto r = query(sql);

    WalletTrades out;
    for (size_t i = 0; i < r->RowCount(); ++i) {
      auto side = belief::parse_side(r->GetValue(2, i).ToString());
      auto action = belief::parse_action(r->GetValue(3, i).ToString());
      if (!side || !action)
        continue;
      belief::Trade t;
      t.ts = r->GetValue(1, i).GetValue<int64_t>();
      t.side = *side;
      t.action = *action;
      t.price = r->GetValue(4, i).GetValue<double>();
      t.size = r->GetValue(5, i).GetValue<double>();
      out[r->GetValue(0, i).ToString()].push_back(t);
    }
    return out;
  }

  // 最近一笔合法交易的隐含 YES 价格, 无交易时 0.5
  double market_prob_at(const std::string &market_id, int64_t ts) {
    auto r = query("SELECT side, price FROM trades WHERE market_id = " + schema::escape_sql(market_id) +
                   " AND ts <= " + std::to_string(ts) + " AND " + VALID_TRADE_SQL +
                   " ORDER BY ts DESC, id DESC LIMIT 1");
    if (r->RowCount() == 0)
      return 0.5;
    auto side = belief::parse_side(r->GetValue(0, 0).ToString());
    return belief::implied_yes_price(*side, r->GetValue(1, 0).GetValue<double>());
  }

  // 截至 ts (含) 的第一笔交易时间
  std::optional<int64_t> first_trade_at_or_before(const std::string &market_id, int64_t ts) {
    auto r = query("SELECT MIN(ts) FROM trades WHERE market_id = " + schema::escape_sql(market_id) +
                   " AND ts <= " + std::to_string(ts));
    if (r->RowCount() == 0 || r->GetValue(0, 0).IsNull())
      return std::nullopt;
    return r->GetValue(0, 0).GetValue<int64_t>();
  }

  std::optional<std::pair<int64_t, int64_t>> trade_time_range(const std::string &market_id) {
    auto r = query("SELECT MIN(ts), MAX(ts) FROM trades WHERE market_id = " + schema::escape_sql(market_id));
    if (r->RowCount() == 0 || r->GetValue(0, 0).IsNull())
      return std::nullopt;
    return std::make_pair(r->GetValue(0, 0).GetValue<int64_t>(), r->GetValue(1, 0).GetValue<int64_t>());
  }

  duckdb::Connection &connection() { return *conn_; }

private:
  auto query(const std::string &sql) {
    auto r = conn_->Query(sql);
    if (r->HasError())
      throw std::runtime_error("[store] query failed: " + r->GetError());
    return r;
  }

  static ResolvedMarket read_resolved(duckdb::MaterializedQueryResult &r, size_t row) {
    ResolvedMarket m;
    m.id = r.GetValue(0, row).ToString();
    m.end_time = r.GetValue(1, row).GetValue<int64_t>();
    m.resolution_time = r.GetValue(2, row).GetValue<int64_t>();
    m.outcome = r.GetValue(3, row).GetValue<int32_t>() != 0 ? 1 : 0;
    return m;
  }

  std::unique_ptr<duckdb::Connection> conn_;
};

} // namespace store
