#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

// ============================================================================
// 配置结构
// ============================================================================

struct Config {
  std::string db_path;

  // belief 推断
  double half_life_hours = 48.0;

  // backtest
  double backtest_cutoff_hours = 1.0;
  int sweep_max_hours = 168;
  int backtest_workers = 0; // 0 = hardware_concurrency

  // pipeline
  int recompute_interval_seconds = 300;
  bool include_resolved_snapshots = false;
  int backfill_points = 0;
  int screener_limit = 25;

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
      throw std::runtime_error("无法打开配置文件: " + path);

    json j;
    f >> j;

    if (!j.contains("db_path"))
      throw std::runtime_error("配置文件缺少必填字段 db_path");

    Config config;
    config.db_path = j["db_path"].get<std::string>();
    config.half_life_hours = j.value("half_life_hours", 48.0);
    config.backtest_cutoff_hours = j.value("backtest_cutoff_hours", 1.0);
    config.sweep_max_hours = j.value("sweep_max_hours", 168);
    config.backtest_workers = j.value("backtest_workers", 0);
    config.recompute_interval_seconds = j.value("recompute_interval_seconds", 300);
    config.include_resolved_snapshots = j.value("include_resolved_snapshots", false);
    config.backfill_points = j.value("backfill_points", 0);
    config.screener_limit = j.value("screener_limit", 25);
    return config;
  }
};
