#pragma once

// ============================================================================
// 表定义
// 交易/市场/结算为外部写入, 其余表由 recompute / snapshot / backtest 全量或按 key 写入
// ============================================================================

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>

namespace schema {

// 通配符: category / horizon_bucket 聚合维度
inline constexpr const char *ALL = "ALL";

// ============================================================================
// 工具函数
// ============================================================================

inline std::string escape_sql_raw(const std::string &s) {
  std::string r;
  r.reserve(s.size());
  for (char c : s) {
    if (c == '\'')
      r += "''";
    else
      r += c;
  }
  return r;
}

inline std::string escape_sql(const std::string &s) {
  return "'" + escape_sql_raw(s) + "'";
}

// DOUBLE 字面量, 17 位有效数字保证写入/读出一致 (std::to_string 只有 6 位小数)
inline std::string sql_double(double v) {
  if (!std::isfinite(v))
    return "NULL";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  return buf;
}

// ============================================================================
// 输入表 (外部 ingestion 写入)
// ============================================================================

inline const char *MARKETS_DDL = R"(
CREATE TABLE IF NOT EXISTS markets (
    id VARCHAR PRIMARY KEY,
    question VARCHAR NOT NULL DEFAULT '',
    category VARCHAR NOT NULL DEFAULT 'unknown',
    end_time BIGINT NOT NULL,
    liquidity DOUBLE NOT NULL DEFAULT 0
))";

// price/size 不加 CHECK: 校验属于 ingestion, 核心对异常行做跳过处理
inline const char *TRADES_DDL = R"(
CREATE TABLE IF NOT EXISTS trades (
    id VARCHAR PRIMARY KEY,
    market_id VARCHAR NOT NULL,
    wallet VARCHAR NOT NULL,
    ts BIGINT NOT NULL,
    side VARCHAR NOT NULL,
    action VARCHAR NOT NULL,
    price DOUBLE NOT NULL,
    size DOUBLE NOT NULL
))";

inline const char *OUTCOMES_DDL = R"(
CREATE TABLE IF NOT EXISTS outcomes (
    market_id VARCHAR PRIMARY KEY,
    resolved_outcome INTEGER NOT NULL,
    resolution_time BIGINT NOT NULL
))";

// ============================================================================
// 派生表
// ============================================================================

inline const char *WALLET_METRICS_DDL = R"(
CREATE TABLE IF NOT EXISTS wallet_metrics (
    wallet VARCHAR NOT NULL,
    category VARCHAR NOT NULL,
    horizon_bucket VARCHAR NOT NULL,
    sample_markets BIGINT NOT NULL,
    sample_trades BIGINT NOT NULL,
    brier DOUBLE NOT NULL,
    log_loss DOUBLE NOT NULL,
    roi DOUBLE NOT NULL,
    calibration_error DOUBLE NOT NULL,
    avg_trade_size DOUBLE NOT NULL,
    churn DOUBLE NOT NULL,
    persistence DOUBLE NOT NULL,
    specialization DOUBLE NOT NULL,
    timing_edge DOUBLE NOT NULL,
    updated_at BIGINT NOT NULL,
    PRIMARY KEY (wallet, category, horizon_bucket)
))";

inline const char *WALLET_WEIGHTS_DDL = R"(
CREATE TABLE IF NOT EXISTS wallet_weights (
    wallet VARCHAR NOT NULL,
    category VARCHAR NOT NULL,
    horizon_bucket VARCHAR NOT NULL,
    weight DOUBLE NOT NULL,
    uncertainty DOUBLE NOT NULL,
    support BIGINT NOT NULL,
    updated_at BIGINT NOT NULL,
    PRIMARY KEY (wallet, category, horizon_bucket)
))";

inline const char *SNAPSHOTS_DDL = R"(
CREATE TABLE IF NOT EXISTS smartcrowd_snapshots (
    market_id VARCHAR NOT NULL,
    snapshot_time BIGINT NOT NULL,
    market_prob DOUBLE NOT NULL,
    smartcrowd_prob DOUBLE NOT NULL,
    divergence DOUBLE NOT NULL,
    confidence DOUBLE NOT NULL,
    disagreement DOUBLE NOT NULL,
    participation_quality DOUBLE NOT NULL,
    integrity_risk DOUBLE NOT NULL,
    active_wallets INTEGER NOT NULL,
    top_drivers VARCHAR NOT NULL,
    cohort_summary VARCHAR NOT NULL,
    flip_conditions VARCHAR NOT NULL,
    explanation_json VARCHAR NOT NULL,
    PRIMARY KEY (market_id, snapshot_time)
))";

inline const char *MARKET_BACKTESTS_DDL = R"(
CREATE TABLE IF NOT EXISTS market_backtests (
    run_id VARCHAR NOT NULL,
    market_id VARCHAR NOT NULL,
    cutoff_time BIGINT NOT NULL,
    market_prob DOUBLE NOT NULL,
    smartcrowd_prob DOUBLE NOT NULL,
    outcome INTEGER NOT NULL,
    confidence DOUBLE NOT NULL,
    divergence DOUBLE NOT NULL,
    PRIMARY KEY (run_id, market_id)
))";

inline const char *BACKTEST_REPORTS_DDL = R"(
CREATE TABLE IF NOT EXISTS backtest_reports (
    run_id VARCHAR PRIMARY KEY,
    generated_at BIGINT NOT NULL,
    summary_json VARCHAR NOT NULL
))";

// ============================================================================
// 运行记录 (pipeline)
// ============================================================================

inline const char *PIPELINE_RUNS_DDL = R"(
CREATE TABLE IF NOT EXISTS pipeline_runs (
    run_id VARCHAR PRIMARY KEY,
    run_type VARCHAR NOT NULL,
    status VARCHAR NOT NULL,
    started_at BIGINT NOT NULL,
    finished_at BIGINT,
    duration_ms DOUBLE,
    metrics_json VARCHAR,
    error_text VARCHAR
))";

inline const char *SYSTEM_METRICS_DDL = R"(
CREATE TABLE IF NOT EXISTS system_metrics (
    metric_key VARCHAR PRIMARY KEY,
    metric_value DOUBLE NOT NULL,
    updated_at BIGINT NOT NULL
))";

inline const char *INDEXES_DDL[] = {
    "CREATE INDEX IF NOT EXISTS idx_trades_market_ts ON trades(market_id, ts)",
    "CREATE INDEX IF NOT EXISTS idx_trades_wallet_ts ON trades(wallet, ts)",
    "CREATE INDEX IF NOT EXISTS idx_market_backtests_run ON market_backtests(run_id)",
};

inline const char *ALL_TABLES_DDL[] = {
    MARKETS_DDL,       TRADES_DDL,           OUTCOMES_DDL,
    WALLET_METRICS_DDL, WALLET_WEIGHTS_DDL,  SNAPSHOTS_DDL,
    MARKET_BACKTESTS_DDL, BACKTEST_REPORTS_DDL, PIPELINE_RUNS_DDL,
    SYSTEM_METRICS_DDL,
};

} // namespace schema
