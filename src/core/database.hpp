#pragma once

#include <duckdb.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "schema.hpp"

using Params = std::vector<duckdb::Value>;

// ============================================================================
// Rows - 物化查询结果的只读视图
// ============================================================================
class Rows {
public:
  explicit Rows(duckdb::unique_ptr<duckdb::QueryResult> result) : result_(std::move(result)) {}

  size_t size() const { return materialized().RowCount(); }
  bool empty() const { return size() == 0; }

  bool is_null(size_t row, size_t col) const { return value(row, col).IsNull(); }

  int64_t get_int(size_t row, size_t col) const {
    auto v = value(row, col);
    return v.IsNull() ? 0 : v.GetValue<int64_t>();
  }

  bool get_bool(size_t row, size_t col) const {
    auto v = value(row, col);
    return v.IsNull() ? false : v.GetValue<bool>();
  }

  std::string get_string(size_t row, size_t col) const {
    auto v = value(row, col);
    return v.IsNull() ? std::string() : v.ToString();
  }

private:
  duckdb::MaterializedQueryResult &materialized() const {
    return static_cast<duckdb::MaterializedQueryResult &>(*result_);
  }

  duckdb::Value value(size_t row, size_t col) const { return materialized().GetValue(col, row); }

  duckdb::unique_ptr<duckdb::QueryResult> result_;
};

// ============================================================================
// Database - DuckDB 封装
// 写连接: 单写者, 所有业务操作都在 transact() 里完成
// 读连接: 只读快照查询
// ============================================================================
class Database {
public:
  // 事务句柄, 只能在 transact() 回调中使用
  class Tx {
  public:
    // 返回受影响行数 (UPDATE/DELETE/INSERT)
    int64_t exec(const std::string &sql, const Params &params = {}) {
      Rows rows = db_.run(*db_.write_conn_, sql, params);
      return rows.empty() ? 0 : rows.get_int(0, 0);
    }

    Rows query(const std::string &sql, const Params &params = {}) {
      return db_.run(*db_.write_conn_, sql, params);
    }

    // INSERT ... RETURNING id
    int64_t insert_returning_id(const std::string &sql, const Params &params) {
      Rows rows = db_.run(*db_.write_conn_, sql, params);
      if (rows.empty()) {
        throw LedgerError(ErrorKind::Storage, "insert returned no id");
      }
      return rows.get_int(0, 0);
    }

  private:
    friend class Database;
    explicit Tx(Database &db) : db_(db) {}
    Database &db_;
  };

  explicit Database(const std::string &path) : db_path_(path) {
    db_ = std::make_unique<duckdb::DuckDB>(path);
    read_conn_ = std::make_unique<duckdb::Connection>(*db_);
    write_conn_ = std::make_unique<duckdb::Connection>(*db_);
  }

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  // ========================================================================
  // 原子操作单元: BEGIN -> fn(tx) -> COMMIT, 任何异常都 ROLLBACK 后原样抛出
  // ========================================================================
  template <typename Fn>
  auto transact(Fn &&fn) -> decltype(fn(std::declval<Tx &>())) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    raw(*write_conn_, "BEGIN TRANSACTION");
    Tx tx(*this);
    try {
      if constexpr (std::is_void_v<decltype(fn(tx))>) {
        fn(tx);
        raw(*write_conn_, "COMMIT");
      } else {
        auto result = fn(tx);
        raw(*write_conn_, "COMMIT");
        return result;
      }
    } catch (...) {
      rollback();
      throw;
    }
  }

  // 只读查询, 走读连接
  Rows query(const std::string &sql, const Params &params = {}) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    return run(*read_conn_, sql, params);
  }

  int64_t query_single_int(const std::string &sql, const Params &params = {}) {
    Rows rows = query(sql, params);
    return rows.empty() ? 0 : rows.get_int(0, 0);
  }

  int64_t get_table_count(const std::string &table) {
    return query_single_int("SELECT COUNT(*) FROM " + table);
  }

  void init_schema() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    for (const char *ddl : schema::ddl::ALL) {
      raw(*write_conn_, ddl);
    }
    std::cout << "[DB] schema ready (" << db_path_ << ")" << std::endl;
  }

private:
  void rollback() {
    auto result = write_conn_->Query("ROLLBACK");
    if (result->HasError()) {
      // COMMIT 本身失败时事务已被 DuckDB 终止
      std::cerr << "[DB] rollback: " << result->GetError() << std::endl;
    }
  }

  static void raw(duckdb::Connection &conn, const std::string &sql) {
    auto result = conn.Query(sql);
    if (result->HasError()) {
      throw LedgerError(ErrorKind::Storage, result->GetError());
    }
  }

  static Rows run(duckdb::Connection &conn, const std::string &sql, const Params &params) {
    auto stmt = conn.Prepare(sql);
    if (stmt->HasError()) {
      throw LedgerError(ErrorKind::Storage, stmt->GetError());
    }
    duckdb::vector<duckdb::Value> values(params.begin(), params.end());
    auto result = stmt->Execute(values, false);
    if (result->HasError()) {
      throw LedgerError(ErrorKind::Storage, result->GetError());
    }
    return Rows(std::move(result));
  }

  std::string db_path_;
  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> read_conn_;
  std::unique_ptr<duckdb::Connection> write_conn_;
  std::mutex read_mutex_;
  std::mutex write_mutex_;
};
