#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "snapshot/aggregator.hpp"
#include "snapshot/cohort.hpp"
#include "snapshot/snapshot_builder.hpp"
#include "test_support.hpp"

using snapshot::Cohort;
using snapshot::WalletSignal;

namespace {

WalletSignal wallet_signal(const std::string &wallet, double belief, double effective_weight, double churn = 0.0,
                    Cohort cohort = Cohort::GENERALIST_FLOW) {
  WalletSignal s;
  s.wallet = wallet;
  s.belief = belief;
  s.confidence = 0.5;
  s.churn = churn;
  s.trust_weight = effective_weight * 2.0;
  s.effective_weight = effective_weight;
  s.cohort = cohort;
  return s;
}

metrics::WalletMetric profile() {
  metrics::WalletMetric p;
  p.churn = 0.5;
  p.persistence = 0.5;
  p.specialization = 0.0;
  p.timing_edge = 0.0;
  p.avg_trade_size = 10.0;
  p.brier = 0.3;
  p.roi = 0.5;
  p.sample_markets = 10;
  return p;
}

} // namespace

// ============================================================================
// Cohort 规则
// ============================================================================

TEST(CohortRules, RulesApplyInFixedOrder) {
  auto p = profile();
  EXPECT_EQ(snapshot::classify_profile(p), Cohort::GENERALIST_FLOW);

  p.churn = 0.7;
  p.timing_edge = 0.5; // 高 churn 优先
  EXPECT_EQ(snapshot::classify_profile(p), Cohort::NOISE_CHURNER);

  p = profile();
  p.churn = 0.3;
  p.timing_edge = 0.3;
  p.persistence = 0.9;
  p.specialization = 0.9; // timing 先于 informed
  EXPECT_EQ(snapshot::classify_profile(p), Cohort::TIMING_SPECIALIST);

  p.sample_markets = 4; // timing 需要 ≥ 5 个市场, informed 需要 ≥ 6
  EXPECT_EQ(snapshot::classify_profile(p), Cohort::GENERALIST_FLOW);

  p = profile();
  p.persistence = 0.8;
  p.specialization = 0.5;
  p.sample_markets = 6;
  EXPECT_EQ(snapshot::classify_profile(p), Cohort::INFORMED_ACCUMULATOR);

  p = profile();
  p.avg_trade_size = 500;
  p.churn = 0.4;
  EXPECT_EQ(snapshot::classify_profile(p), Cohort::WHALE_CONVICTION);

  p = profile();
  p.brier = 0.1;
  p.specialization = 0.45;
  EXPECT_EQ(snapshot::classify_profile(p), Cohort::CATEGORY_SPECIALIST);

  p = profile();
  p.churn = 0.2;
  p.roi = -0.01;
  EXPECT_EQ(snapshot::classify_profile(p), Cohort::MAKER_ARB);
}

TEST(CohortRules, SignalFallbackWithoutProfile) {
  EXPECT_EQ(snapshot::classify(nullptr, 0.8, 0.9), Cohort::NOISE_CHURNER);
  EXPECT_EQ(snapshot::classify(nullptr, 0.2, 0.6), Cohort::INFORMED_ACCUMULATOR);
  EXPECT_EQ(snapshot::classify(nullptr, 0.2, 0.3), Cohort::GENERALIST_FLOW);

  auto p = profile();
  p.churn = 0.9;
  EXPECT_EQ(snapshot::classify(&p, 0.0, 0.9), Cohort::NOISE_CHURNER);
  EXPECT_STREQ(snapshot::cohort_name(Cohort::MAKER_ARB), "maker_arb");
}

// ============================================================================
// 纯聚合
// ============================================================================

TEST(Aggregator, NoSignalsFallsBackToMarket) {
  auto snap = snapshot::aggregate("m", 100, 0.37, {});
  EXPECT_DOUBLE_EQ(snap.aggregate_prob, 0.37);
  EXPECT_DOUBLE_EQ(snap.divergence, 0.0);
  EXPECT_DOUBLE_EQ(snap.confidence, 0.0);
  EXPECT_DOUBLE_EQ(snap.integrity_risk, 1.0);
  EXPECT_EQ(snap.active_wallets, 0);
  EXPECT_TRUE(snap.cohort_summary.empty());
  EXPECT_TRUE(snap.flip_conditions.empty());
  EXPECT_NE(snap.explanation["summary"].get<std::string>().find("No qualifying"), std::string::npos);
}

TEST(Aggregator, SingleWalletConfidenceIncludesThinSamplePenalty) {
  auto snap = snapshot::aggregate("m", 100, 0.5, {wallet_signal("a", 0.8, 1.0)});
  EXPECT_NEAR(snap.aggregate_prob, 0.8, 1e-12);
  EXPECT_NEAR(snap.disagreement, 0.0, 1e-12);
  EXPECT_NEAR(snap.integrity_risk, 0.55, 1e-12);
  double expected = (1.0 / 11.0) * 1.0 * (1.0 / 15.0) * (1.0 - 0.70 * 0.55) * 0.60;
  EXPECT_NEAR(snap.confidence, expected, 1e-12);
  EXPECT_NEAR(snap.participation_quality, 1.0 / 12.0, 1e-12);
}

TEST(Aggregator, TopDriversAndBounds) {
  std::vector<WalletSignal> signals;
  for (int i = 0; i < 10; ++i)
    signals.push_back(wallet_signal("w" + std::to_string(i), 0.1 + 0.08 * i, 1.0, 0.1 * i));
  auto snap = snapshot::aggregate("m", 100, 0.5, signals);

  EXPECT_EQ(snap.active_wallets, 10);
  ASSERT_EQ(snap.top_drivers.size(), 8u);
  for (size_t i = 1; i < snap.top_drivers.size(); ++i) {
    EXPECT_GE(std::abs(snap.top_drivers[i - 1]["contribution"].get<double>()),
              std::abs(snap.top_drivers[i]["contribution"].get<double>()));
  }
  EXPECT_NEAR(snap.participation_quality, 10.0 / 12.0, 1e-9);
  for (double v : {snap.confidence, snap.disagreement, snap.participation_quality, snap.integrity_risk}) {
    EXPECT_GE(v, 0.0);
    EXPECT_LE(v, 1.0);
  }
  EXPECT_GE(snap.aggregate_prob, 0.001);
  EXPECT_LE(snap.aggregate_prob, 0.999);
}

TEST(Aggregator, FlipConditionsForYesLeaningSignal) {
  auto snap = snapshot::aggregate("m", 100, 0.5, {wallet_signal("a", 0.8, 1.0, 0.0, Cohort::WHALE_CONVICTION)});
  ASSERT_EQ(snap.flip_conditions.size(), 2u);
  EXPECT_EQ(snap.flip_conditions[0]["condition"].get<std::string>(), "trusted_no_flow_needed");
  // D × (agg − mkt) / mkt = 1 × 0.3 / 0.5
  EXPECT_NEAR(snap.flip_conditions[0]["required_effective_weight"].get<double>(), 0.6, 1e-9);
  EXPECT_EQ(snap.flip_conditions[1]["condition"].get<std::string>(), "lead_cohort_reversal");
  EXPECT_EQ(snap.flip_conditions[1]["lead_cohort"].get<std::string>(), "whale_conviction");
}

TEST(Aggregator, FlipConditionsForNoLeaningSignal) {
  auto snap = snapshot::aggregate("m", 100, 0.6, {wallet_signal("a", 0.2, 2.0)});
  ASSERT_FALSE(snap.flip_conditions.empty());
  EXPECT_EQ(snap.flip_conditions[0]["condition"].get<std::string>(), "trusted_yes_flow_needed");
  // 2 × (0.6 − 0.2) / 0.4
  EXPECT_NEAR(snap.flip_conditions[0]["required_effective_weight"].get<double>(), 2.0, 1e-9);
}

TEST(Aggregator, AlignedSignalHasSingleCondition) {
  auto snap = snapshot::aggregate("m", 100, 0.5, {wallet_signal("a", 0.5, 1.0)});
  ASSERT_EQ(snap.flip_conditions.size(), 1u);
  EXPECT_EQ(snap.flip_conditions[0]["condition"].get<std::string>(), "signal_aligned_with_market");
}

TEST(Aggregator, CohortsSortedByNetContribution) {
  auto snap = snapshot::aggregate("m", 100, 0.5,
                                  {wallet_signal("a", 0.9, 1.0, 0.0, Cohort::MAKER_ARB),
                                   wallet_signal("b", 0.45, 1.0, 0.0, Cohort::TIMING_SPECIALIST),
                                   wallet_signal("c", 0.1, 0.2, 0.0, Cohort::MAKER_ARB)});
  ASSERT_EQ(snap.cohort_summary.size(), 2u);
  EXPECT_EQ(snap.cohort_summary[0]["cohort"].get<std::string>(), "maker_arb");
  EXPECT_EQ(snap.cohort_summary[0]["wallet_count"].get<int64_t>(), 2);
  EXPECT_NEAR(snap.cohort_summary[0]["net_contribution"].get<double>(), 0.4 - 0.08, 1e-6);
  EXPECT_TRUE(snap.explanation["evidence"]["top_cohorts"] == snap.cohort_summary);
}

TEST(Aggregator, MakeWalletSignalDropsZeroConfidence) {
  belief::BeliefSignal neutral;
  EXPECT_FALSE(snapshot::make_wallet_signal("w", neutral, {1.0, 1.0}, Cohort::GENERALIST_FLOW));

  belief::BeliefSignal sig;
  sig.belief = 0.7;
  sig.confidence = 0.5;
  sig.churn = 0.0;
  sig.persistence = 1.0;
  auto ws = snapshot::make_wallet_signal("w", sig, {2.0, 0.0}, Cohort::GENERALIST_FLOW);
  ASSERT_TRUE(ws);
  // anti_noise = 1.0 × 1.15, uncertainty discount = 1.0
  EXPECT_NEAR(ws->trust_weight, 2.3, 1e-12);
  EXPECT_NEAR(ws->effective_weight, 1.15, 1e-12);
}

// ============================================================================
// 端到端 (库)
// ============================================================================

class SnapshotStoreTest : public StoreTest {
protected:
  void SetUp() override {
    StoreTest::SetUp();
    add_market("M", T0 + 100 * HOUR);
    add_outcome("M", 1, T0 + 100 * HOUR);
    add_trade("M", "c", T0 - 2 * HOUR, "YES", "BUY", 0.7, 0); // 单笔异常交易, confidence 0
    add_trade("M", "a", T0 - 60, "YES", "BUY", 0.60, 100);
    add_trade("M", "b", T0, "NO", "BUY", 0.55, 50);
    add_weight("a", 2.0, 0.0);
    add_weight("b", 1.0, 0.0);
    add_weight("c", 0.5, 0.0);
  }
};

TEST_F(SnapshotStoreTest, WeightedTowardHigherTrustWallet) {
  auto snap = snapshot::build_market_snapshot(db, "M", T0, false);
  EXPECT_EQ(snap.active_wallets, 2);
  EXPECT_NEAR(snap.market_prob, 0.45, 1e-12);

  double belief_a = 0.8;
  double belief_b = 0.225;
  EXPECT_GT(snap.aggregate_prob, belief_b);
  EXPECT_LT(snap.aggregate_prob, belief_a);
  EXPECT_GT(snap.aggregate_prob, (belief_a + belief_b) / 2);
  EXPECT_GT(snap.divergence, 0.0);
  EXPECT_NEAR(snap.divergence, snap.aggregate_prob - snap.market_prob, 1e-12);

  ASSERT_EQ(snap.top_drivers.size(), 2u);
  EXPECT_EQ(snap.top_drivers[0]["wallet"].get<std::string>(), "a");
  EXPECT_EQ(snap.top_drivers[1]["wallet"].get<std::string>(), "b");
  EXPECT_EQ(db.get_table_count("smartcrowd_snapshots"), 0);
}

TEST_F(SnapshotStoreTest, SwappingWeightsMovesAggregate) {
  auto before = snapshot::build_market_snapshot(db, "M", T0, false);
  db.execute("DELETE FROM wallet_weights");
  add_weight("a", 0.5, 0.0);
  add_weight("b", 2.0, 0.0);
  auto after = snapshot::build_market_snapshot(db, "M", T0, false);
  EXPECT_LT(after.aggregate_prob, before.aggregate_prob);
}

TEST_F(SnapshotStoreTest, RepeatedSnapshotIsByteIdentical) {
  auto a = snapshot::build_market_snapshot(db, "M", T0, true);
  auto b = snapshot::build_market_snapshot(db, "M", T0, true);
  EXPECT_EQ(a.to_json().dump(), b.to_json().dump());
  EXPECT_EQ(db.get_table_count("smartcrowd_snapshots"), 1);

  auto row = db.query_json("SELECT explanation_json, top_drivers FROM smartcrowd_snapshots WHERE market_id = 'M'");
  ASSERT_EQ(row.size(), 1u);
  EXPECT_EQ(row[0]["explanation_json"].get<std::string>(), a.explanation.dump());
  EXPECT_EQ(row[0]["top_drivers"].get<std::string>(), a.top_drivers.dump());
}

TEST_F(SnapshotStoreTest, ZeroSignalMarketIsPersistable) {
  add_market("Z", T0 + 10 * HOUR);
  add_trade("Z", "x", T0 - HOUR, "YES", "BUY", 0.6, 0);
  add_trade("Z", "y", T0 - HOUR, "NO", "SELL", 1.4, 20);

  auto snap = snapshot::build_market_snapshot(db, "Z", T0, true);
  EXPECT_DOUBLE_EQ(snap.aggregate_prob, snap.market_prob);
  EXPECT_DOUBLE_EQ(snap.market_prob, 0.5);
  EXPECT_DOUBLE_EQ(snap.integrity_risk, 1.0);
  EXPECT_EQ(snap.active_wallets, 0);
  EXPECT_EQ(db.query_single_int("SELECT active_wallets FROM smartcrowd_snapshots WHERE market_id = 'Z'"), 0);
}

TEST_F(SnapshotStoreTest, SnapshotBeforeFirstTradeHasDefaultMarketProb) {
  auto snap = snapshot::build_market_snapshot(db, "M", T0 - 10 * HOUR, false);
  EXPECT_DOUBLE_EQ(snap.market_prob, 0.5);
  EXPECT_EQ(snap.active_wallets, 0);
}

TEST_F(SnapshotStoreTest, UnknownMarketThrows) {
  EXPECT_THROW(snapshot::build_market_snapshot(db, "nope", T0, false), snapshot::UnknownMarketError);
}

TEST_F(SnapshotStoreTest, BatchBackfillAndScreener) {
  add_market("open", T0 + 50 * HOUR, "sports");
  add_trade("open", "a", T0 - 10 * HOUR, "YES", "BUY", 0.3, 200);
  add_trade("open", "d", T0 - 5 * HOUR, "YES", "BUY", 0.35, 50);

  // 已结算的 M 默认跳过
  EXPECT_EQ(snapshot::build_snapshots_for_all_markets(db, T0, false), 1);
  EXPECT_EQ(db.query_single_int("SELECT COUNT(*) FROM smartcrowd_snapshots WHERE market_id = 'M'"), 0);
  EXPECT_EQ(snapshot::build_snapshots_for_all_markets(db, T0, true), 2);
  EXPECT_EQ(db.get_table_count("smartcrowd_snapshots"), 2);

  EXPECT_EQ(snapshot::backfill_market_snapshots(db, 3, false), 3);
  auto times = db.query_json("SELECT snapshot_time FROM smartcrowd_snapshots WHERE market_id = 'open' AND "
                             "snapshot_time <> " + std::to_string(T0) + " ORDER BY snapshot_time");
  ASSERT_EQ(times.size(), 3u);
  EXPECT_EQ(times[0]["snapshot_time"].get<int64_t>(), T0 - 10 * HOUR);
  EXPECT_EQ(times[1]["snapshot_time"].get<int64_t>(), T0 + 20 * HOUR);
  EXPECT_EQ(times[2]["snapshot_time"].get<int64_t>(), T0 + 50 * HOUR);

  auto rows = snapshot::latest_screener_rows(db, 10);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_GE(std::abs(rows[0]["divergence"].get<double>()), std::abs(rows[1]["divergence"].get<double>()));
  EXPECT_EQ(rows[0].count("question"), 1u);
  for (const auto &r : rows) {
    if (r["market_id"] == "open") {
      EXPECT_EQ(r["snapshot_time"].get<int64_t>(), T0 + 50 * HOUR);
    }
  }
  EXPECT_EQ(snapshot::latest_screener_rows(db, 1).size(), 1u);
}
