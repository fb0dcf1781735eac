#pragma once

// ============================================================================
// 运行记录: pipeline_runs 一次一行, system_metrics 累加计数器
//
// ops.<op>.count / success_count / error_count
// ops.<op>.duration_ms.sum / max / last
// pipeline.<op>.<status>.count
// errors.<op>
// ============================================================================

#include "../core/database.hpp"
#include "../core/schema.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pipeline {

using json = nlohmann::json;

static constexpr size_t MAX_ERROR_TEXT = 4000;

class RunTracker {
public:
  explicit RunTracker(Database &db) : db_(db) {}

  void start(const std::string &run_id, const std::string &run_type, const json &metadata) {
    db_.execute("INSERT INTO pipeline_runs (run_id, run_type, status, started_at, metrics_json) VALUES (" +
                schema::escape_sql(run_id) + ", " + schema::escape_sql(run_type) + ", 'running', " +
                std::to_string(now_unix()) + ", " + schema::escape_sql(metadata.dump()) + ")");
  }

  void finish(const std::string &run_id, const std::string &run_type, const std::string &status,
              double duration_ms, const json &metrics, const std::optional<std::string> &error_text) {
    std::string err = "NULL";
    if (error_text)
      err = schema::escape_sql(error_text->substr(0, MAX_ERROR_TEXT));
    db_.execute("UPDATE pipeline_runs SET status = " + schema::escape_sql(status) +
                ", finished_at = " + std::to_string(now_unix()) + ", duration_ms = " + schema::sql_double(duration_ms) +
                ", metrics_json = " + schema::escape_sql(metrics.dump()) + ", error_text = " + err +
                " WHERE run_id = " + schema::escape_sql(run_id));

    record_operation(run_type, duration_ms, status == "success");
    increment("pipeline." + run_type + "." + status + ".count", 1.0);
  }

  void record_operation(const std::string &op, double duration_ms, bool success) {
    std::string key = "ops." + safe_key(op);
    increment(key + ".count", 1.0);
    increment(key + (success ? ".success_count" : ".error_count"), 1.0);
    increment(key + ".duration_ms.sum", duration_ms);
    upsert(key + ".duration_ms.max", duration_ms, "GREATEST(system_metrics.metric_value, excluded.metric_value)");
    upsert(key + ".duration_ms.last", duration_ms, "excluded.metric_value");
  }

  void increment(const std::string &key, double delta) {
    upsert(key, delta, "system_metrics.metric_value + excluded.metric_value");
  }

  json recent_runs(int limit = 50) {
    return db_.query_json("SELECT run_id, run_type, status, started_at, finished_at, duration_ms, metrics_json, "
                          "error_text FROM pipeline_runs ORDER BY started_at DESC, run_id LIMIT " +
                          std::to_string(limit));
  }

  json system_metrics() {
    json out = json::object();
    for (const auto &row : db_.query_json("SELECT metric_key, metric_value FROM system_metrics ORDER BY metric_key"))
      out[row["metric_key"].get<std::string>()] = row["metric_value"];
    return out;
  }

private:
  static std::string safe_key(std::string s) {
    for (auto &c : s) {
      if (c == ' ' || c == '/')
        c = '_';
    }
    return s;
  }

  void upsert(const std::string &key, double value, const std::string &merge_expr) {
    db_.execute("INSERT INTO system_metrics (metric_key, metric_value, updated_at) VALUES (" +
                schema::escape_sql(key) + ", " + schema::sql_double(value) + ", " + std::to_string(now_unix()) +
                ") ON CONFLICT (metric_key) DO UPDATE SET metric_value = " + merge_expr +
                ", updated_at = excluded.updated_at");
  }

  Database &db_;
};

} // namespace pipeline
