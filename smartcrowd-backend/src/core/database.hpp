#pragma once

#include "schema.hpp"
#include <algorithm>
#include <chrono>
#include <duckdb.hpp>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

inline int64_t now_unix() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

class Database {
public:
  // path 为 ":memory:" 时使用内存库 (测试)
  explicit Database(const std::string &path) {
    db_ = std::make_unique<duckdb::DuckDB>(path);
    conn_ = std::make_unique<duckdb::Connection>(*db_);      // 写连接
    read_conn_ = std::make_unique<duckdb::Connection>(*db_); // 读连接
  }

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  void init_schema() {
    for (const char *ddl : schema::ALL_TABLES_DDL)
      execute(ddl);
    for (const char *ddl : schema::INDEXES_DDL)
      execute(ddl);
  }

  // ==========================================================================
  // 事务: 持有写锁直到 commit / 析构; 未 commit 即析构则回滚
  // ==========================================================================
  class Transaction {
  public:
    explicit Transaction(Database &db) : db_(db), lock_(db.write_mutex_) {
      run("BEGIN TRANSACTION");
    }

    ~Transaction() {
      if (open_) {
        auto result = db_.conn_->Query("ROLLBACK");
        if (result->HasError())
          std::cerr << "[Database] ROLLBACK failed: " << result->GetError() << std::endl;
      }
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void execute(const std::string &sql) { run(sql); }

    void batch_insert(const std::string &table, const std::string &columns,
                      const std::vector<std::string> &values_list) {
      for (const auto &sql : build_batch_insert(table, columns, values_list))
        run(sql);
    }

    void commit() {
      run("COMMIT");
      open_ = false;
    }

  private:
    void run(const std::string &sql) {
      auto result = db_.conn_->Query(sql);
      if (result->HasError())
        throw std::runtime_error("transaction statement failed: " + result->GetError());
    }

    Database &db_;
    std::unique_lock<std::mutex> lock_;
    bool open_ = true;
  };

  void execute(const std::string &sql) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto result = conn_->Query(sql);
    if (result->HasError())
      throw std::runtime_error("execute failed: " + result->GetError());
  }

  // 批量 upsert, 按 kInsertBatchRows 切分语句
  void batch_insert(const std::string &table, const std::string &columns,
                    const std::vector<std::string> &values_list) {
    for (const auto &sql : build_batch_insert(table, columns, values_list))
      execute(sql);
  }

  // 只读查询
  int64_t get_table_count(const std::string &table) {
    return query_single_int("SELECT COUNT(*) FROM " + table);
  }

  int64_t query_single_int(const std::string &sql) {
    std::lock_guard<std::mutex> rlock(read_mutex_);
    auto result = read_conn_->Query(sql);
    if (result->HasError())
      throw std::runtime_error("query_single_int failed: " + result->GetError());
    if (result->RowCount() == 0)
      return 0;
    auto val = result->GetValue(0, 0);
    return val.IsNull() ? 0 : val.GetValue<int64_t>();
  }

  json query_json(const std::string &sql) {
    std::lock_guard<std::mutex> rlock(read_mutex_);
    auto result = read_conn_->Query(sql);
    if (result->HasError()) {
      throw std::runtime_error(result->GetError());
    }

    json rows = json::array();
    auto &types = result->types;
    auto names = result->names;

    for (size_t row = 0; row < result->RowCount(); ++row) {
      json obj = json::object();
      for (size_t col = 0; col < result->ColumnCount(); ++col) {
        auto value = result->GetValue(col, row);
        if (value.IsNull()) {
          obj[names[col]] = nullptr;
        } else {
          switch (types[col].id()) {
          case duckdb::LogicalTypeId::BOOLEAN:
            obj[names[col]] = value.GetValue<bool>();
            break;
          case duckdb::LogicalTypeId::TINYINT:
          case duckdb::LogicalTypeId::SMALLINT:
          case duckdb::LogicalTypeId::INTEGER:
            obj[names[col]] = value.GetValue<int32_t>();
            break;
          case duckdb::LogicalTypeId::BIGINT:
          case duckdb::LogicalTypeId::HUGEINT:
            obj[names[col]] = value.GetValue<int64_t>();
            break;
          case duckdb::LogicalTypeId::FLOAT:
          case duckdb::LogicalTypeId::DOUBLE:
          case duckdb::LogicalTypeId::DECIMAL:
            obj[names[col]] = value.GetValue<double>();
            break;
          default:
            obj[names[col]] = value.ToString();
            break;
          }
        }
      }
      rows.push_back(std::move(obj));
    }
    return rows;
  }

  // 获取底层 DuckDB 引用 (流式扫描 / worker 线程各自建 Connection)
  duckdb::DuckDB &get_duckdb() { return *db_; }

private:
  static constexpr size_t kInsertBatchRows = 1000;

  static std::vector<std::string> build_batch_insert(const std::string &table, const std::string &columns,
                                                     const std::vector<std::string> &values_list) {
    std::vector<std::string> statements;
    for (size_t start = 0; start < values_list.size(); start += kInsertBatchRows) {
      size_t end = std::min(values_list.size(), start + kInsertBatchRows);
      std::string sql = "INSERT OR REPLACE INTO " + table + " (" + columns + ") VALUES ";
      for (size_t i = start; i < end; ++i) {
        if (i > start)
          sql += ", ";
        sql += "(" + values_list[i] + ")";
      }
      statements.push_back(std::move(sql));
    }
    return statements;
  }

  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> conn_;      // 写连接
  std::unique_ptr<duckdb::Connection> read_conn_; // 读连接
  std::mutex write_mutex_;
  std::mutex read_mutex_;
};
