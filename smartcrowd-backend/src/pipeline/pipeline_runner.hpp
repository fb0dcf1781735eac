#pragma once

// ============================================================================
// Pipeline Runner: recompute = metrics → weights → snapshots (+ backfill)
// 每次运行写一行 pipeline_runs; 失败时记录 error_text 后重新抛出
// ============================================================================

#include "../backtest/backtest.hpp"
#include "../core/config.hpp"
#include "../core/database.hpp"
#include "../metrics/wallet_metrics.hpp"
#include "../snapshot/snapshot_builder.hpp"
#include "../weights/wallet_weights.hpp"
#include "run_tracker.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace asio = boost::asio;

namespace pipeline {

class Runner {
public:
  Runner(Database &db, const Config &config) : db_(db), config_(config), tracker_(db) {}

  json recompute(std::optional<int64_t> snapshot_time = std::nullopt) {
    return tracked("recompute", [&]() {
      auto m = metrics::recompute_wallet_metrics(db_, config_.half_life_hours);
      auto w = weights::recompute_wallet_weights(db_);
      auto s = snapshot::build_snapshots_for_all_markets(db_, snapshot_time, config_.include_resolved_snapshots,
                                                         config_.half_life_hours);
      json out = {
          {"wallet_metric_rows", m.rows_written},
          {"wallet_weight_rows", w.rows_written},
          {"snapshots_written", s},
      };
      if (config_.backfill_points > 0)
        out["backfill_snapshots_written"] = snapshot::backfill_market_snapshots(
            db_, config_.backfill_points, config_.include_resolved_snapshots, config_.half_life_hours);
      return out;
    });
  }

  json backtest(double cutoff_hours, std::optional<std::string> run_id = std::nullopt) {
    return tracked("backtest", [&]() {
      auto summary = backtest::run_backtest(db_, cutoff_hours, run_id, backtest_options());
      return json{
          {"backtest_run_id", summary["run_id"]},
          {"total_markets", summary["total_markets"]},
      };
    });
  }

  json sweep(int max_hours) {
    json result;
    tracked("backtest_sweep", [&]() {
      result = backtest::run_backtest_sweep(db_, max_hours, backtest_options());
      return json{{"hours_evaluated", result["hours_evaluated"]}};
    });
    return result;
  }

  RunTracker &tracker() { return tracker_; }

private:
  backtest::Options backtest_options() const {
    backtest::Options o;
    o.workers = config_.backtest_workers;
    o.half_life_hours = config_.half_life_hours;
    return o;
  }

  template <typename Fn> json tracked(const std::string &run_type, Fn &&fn) {
    auto run_id = backtest::new_run_id();
    tracker_.start(run_id, run_type, json::object());
    auto t0 = std::chrono::steady_clock::now();
    auto elapsed = [&t0]() {
      return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    };

    json out;
    try {
      out = fn();
    } catch (const std::exception &e) {
      std::cerr << "[Pipeline] " << run_type << " failed: " << e.what() << std::endl;
      tracker_.finish(run_id, run_type, "failed", elapsed(), json::object(), std::string(e.what()));
      tracker_.increment("errors." + run_type, 1.0);
      throw;
    }

    double ms = elapsed();
    tracker_.finish(run_id, run_type, "success", ms, out, std::nullopt);
    std::cout << "[Pipeline] " << run_type << " " << run_id << " ok | " << static_cast<int>(ms) << "ms "
              << out.dump() << std::endl;
    return out;
  }

  Database &db_;
  const Config &config_;
  RunTracker tracker_;
};

// ============================================================================
// 周期性 recompute (serve 模式)
// ============================================================================
class RecomputeScheduler {
public:
  RecomputeScheduler(Runner &runner, int interval_seconds) : runner_(runner), interval_(interval_seconds) {}

  void start(asio::io_context &ioc) {
    ioc_ = &ioc;
    asio::post(*ioc_, [this]() { run_round(); });
  }

  void stop() { stopped_ = true; }

  int rounds() const { return rounds_; }

private:
  void run_round() {
    if (stopped_)
      return;
    ++rounds_;
    try {
      runner_.recompute();
    } catch (const std::exception &e) {
      // 已写入 pipeline_runs, 下一轮照常
      std::cerr << "[Pipeline] round " << rounds_ << " failed: " << e.what() << std::endl;
    }
    std::cout << "[Pipeline] 本轮 recompute 完成, " << interval_ << "s 后开始下一轮" << std::endl;
    schedule_next_round();
  }

  void schedule_next_round() {
    if (stopped_)
      return;
    auto timer = std::make_shared<asio::steady_timer>(*ioc_);
    timer->expires_after(std::chrono::seconds(interval_));
    timer->async_wait([this, timer](boost::system::error_code ec) {
      if (ec)
        return;
      run_round();
    });
  }

  Runner &runner_;
  asio::io_context *ioc_ = nullptr;
  int interval_;
  int rounds_ = 0;
  bool stopped_ = false;
};

} // namespace pipeline
