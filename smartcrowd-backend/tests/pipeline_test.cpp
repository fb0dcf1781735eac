#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "core/config.hpp"
#include "pipeline/pipeline_runner.hpp"
#include "pipeline/run_tracker.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

class PipelineTest : public StoreTest {
protected:
  Config config;

  void SetUp() override {
    StoreTest::SetUp();
    config.db_path = ":memory:";
    config.backtest_workers = 2;

    add_market("open", T0 + 48 * HOUR);
    add_trade("open", "a", T0 - 2 * HOUR, "YES", "BUY", 0.6, 100);
    add_trade("open", "b", T0 - HOUR, "NO", "BUY", 0.5, 40);

    add_market("done", T0);
    add_outcome("done", 1, T0);
    add_trade("done", "a", T0 - 30 * HOUR, "YES", "BUY", 0.4, 100);
    add_trade("done", "b", T0 - 20 * HOUR, "NO", "BUY", 0.55, 80);
  }
};

TEST_F(PipelineTest, RecomputeRecordsSuccessfulRun) {
  pipeline::Runner runner(db, config);
  auto out = runner.recompute(T0);
  EXPECT_GT(out["wallet_metric_rows"].get<int64_t>(), 0);
  EXPECT_EQ(out["wallet_weight_rows"].get<int64_t>(), out["wallet_metric_rows"].get<int64_t>());
  EXPECT_EQ(out["snapshots_written"].get<int64_t>(), 1); // 只有未结算市场
  EXPECT_FALSE(out.contains("backfill_snapshots_written"));

  auto runs = runner.tracker().recent_runs();
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0]["run_type"].get<std::string>(), "recompute");
  EXPECT_EQ(runs[0]["status"].get<std::string>(), "success");
  EXPECT_TRUE(runs[0]["error_text"].is_null());
  EXPECT_TRUE(json::parse(runs[0]["metrics_json"].get<std::string>()) == out);

  auto m = runner.tracker().system_metrics();
  EXPECT_DOUBLE_EQ(m["ops.recompute.count"].get<double>(), 1.0);
  EXPECT_DOUBLE_EQ(m["ops.recompute.success_count"].get<double>(), 1.0);
  EXPECT_DOUBLE_EQ(m["pipeline.recompute.success.count"].get<double>(), 1.0);
  EXPECT_FALSE(m.contains("errors.recompute"));
}

TEST_F(PipelineTest, RecomputeWithBackfill) {
  config.backfill_points = 3;
  config.include_resolved_snapshots = true;
  pipeline::Runner runner(db, config);
  auto out = runner.recompute(T0);
  EXPECT_EQ(out["snapshots_written"].get<int64_t>(), 2);
  EXPECT_EQ(out["backfill_snapshots_written"].get<int64_t>(), 6);
}

TEST_F(PipelineTest, FailedRunIsRecordedAndRethrown) {
  db.execute("DROP TABLE wallet_metrics");
  pipeline::Runner runner(db, config);
  EXPECT_THROW(runner.recompute(), std::runtime_error);

  auto runs = runner.tracker().recent_runs();
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0]["status"].get<std::string>(), "failed");
  EXPECT_FALSE(runs[0]["error_text"].get<std::string>().empty());

  auto m = runner.tracker().system_metrics();
  EXPECT_DOUBLE_EQ(m["errors.recompute"].get<double>(), 1.0);
  EXPECT_DOUBLE_EQ(m["ops.recompute.error_count"].get<double>(), 1.0);
  EXPECT_DOUBLE_EQ(m["pipeline.recompute.failed.count"].get<double>(), 1.0);
}

TEST_F(PipelineTest, BacktestAndSweepAreTracked) {
  pipeline::Runner runner(db, config);
  auto bt = runner.backtest(6.0, std::string("bt-1"));
  EXPECT_EQ(bt["backtest_run_id"].get<std::string>(), "bt-1");
  EXPECT_EQ(bt["total_markets"].get<int64_t>(), 1);

  auto sweep = runner.sweep(3);
  EXPECT_EQ(sweep["hours_evaluated"].get<int64_t>(), 3);

  EXPECT_EQ(db.query_single_int("SELECT COUNT(*) FROM pipeline_runs WHERE status = 'success'"), 2);
  auto m = runner.tracker().system_metrics();
  EXPECT_DOUBLE_EQ(m["ops.backtest.count"].get<double>(), 1.0);
  EXPECT_DOUBLE_EQ(m["ops.backtest_sweep.count"].get<double>(), 1.0);
}

TEST_F(PipelineTest, DurationMaxKeepsLargest) {
  pipeline::RunTracker tracker(db);
  tracker.record_operation("x", 30.0, true);
  tracker.record_operation("x", 10.0, false);
  auto m = tracker.system_metrics();
  EXPECT_DOUBLE_EQ(m["ops.x.duration_ms.max"].get<double>(), 30.0);
  EXPECT_DOUBLE_EQ(m["ops.x.duration_ms.last"].get<double>(), 10.0);
  EXPECT_DOUBLE_EQ(m["ops.x.duration_ms.sum"].get<double>(), 40.0);
  EXPECT_DOUBLE_EQ(m["ops.x.count"].get<double>(), 2.0);
}

TEST_F(PipelineTest, SchedulerRunsFirstRoundImmediately) {
  boost::asio::io_context ioc;
  pipeline::Runner runner(db, config);
  pipeline::RecomputeScheduler scheduler(runner, 3600);
  scheduler.start(ioc);
  ioc.run_for(std::chrono::milliseconds(200));
  EXPECT_EQ(scheduler.rounds(), 1);
  scheduler.stop();
  EXPECT_EQ(db.query_single_int("SELECT COUNT(*) FROM pipeline_runs"), 1);
}

// ============================================================================
// Config
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
  fs::path path = fs::temp_directory_path() / "smartcrowd_config_test.json";

  void TearDown() override { fs::remove(path); }

  void write(const std::string &text) {
    std::ofstream f(path);
    f << text;
  }
};

TEST_F(ConfigTest, DefaultsApply) {
  write(R"({"db_path": "data/smartcrowd.db"})");
  auto c = Config::load(path.string());
  EXPECT_EQ(c.db_path, "data/smartcrowd.db");
  EXPECT_DOUBLE_EQ(c.half_life_hours, 48.0);
  EXPECT_DOUBLE_EQ(c.backtest_cutoff_hours, 1.0);
  EXPECT_EQ(c.sweep_max_hours, 168);
  EXPECT_EQ(c.backtest_workers, 0);
  EXPECT_EQ(c.recompute_interval_seconds, 300);
  EXPECT_FALSE(c.include_resolved_snapshots);
  EXPECT_EQ(c.backfill_points, 0);
}

TEST_F(ConfigTest, OverridesAreRead) {
  write(R"({"db_path": "x.db", "half_life_hours": 12, "backfill_points": 5, "include_resolved_snapshots": true})");
  auto c = Config::load(path.string());
  EXPECT_DOUBLE_EQ(c.half_life_hours, 12.0);
  EXPECT_EQ(c.backfill_points, 5);
  EXPECT_TRUE(c.include_resolved_snapshots);
}

TEST_F(ConfigTest, MissingFileOrDbPathThrows) {
  EXPECT_THROW(Config::load((fs::temp_directory_path() / "no_such_smartcrowd.json").string()), std::runtime_error);
  write(R"({"half_life_hours": 12})");
  EXPECT_THROW(Config::load(path.string()), std::runtime_error);
}
