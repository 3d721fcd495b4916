#pragma once

// ============================================================================
// AccountLedger - 用户现金余额
// debit/credit 只能在事务内调用; 余额永不为负 (条件更新 + CHECK 约束)
// ============================================================================

#include <chrono>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>

#include "../core/clock.hpp"
#include "../core/database.hpp"
#include "../core/errors.hpp"
#include "../core/model.hpp"

namespace ledger {

using fixed::Cents;
using Tx = Database::Tx;

class AccountLedger {
public:
  explicit AccountLedger(Database &db) : db_(db) {}

  // ========================================================================
  // 事务内原语
  // ========================================================================

  std::optional<model::Account> find(Tx &tx, const std::string &user_id) {
    auto rows = tx.query("SELECT user_id, username, balance, birthdate, verified_adult, created_at "
                         "FROM accounts WHERE user_id = ?",
                         {duckdb::Value(user_id)});
    if (rows.empty())
      return std::nullopt;
    return to_account(rows, 0);
  }

  model::Account get(Tx &tx, const std::string &user_id) {
    auto account = find(tx, user_id);
    if (!account) {
      throw LedgerError(ErrorKind::NotFound, "unknown user " + user_id);
    }
    return *account;
  }

  void debit(Tx &tx, const std::string &user_id, Cents amount) {
    check_amount(amount);
    if (amount == 0)
      return;

    int64_t changed = tx.exec("UPDATE accounts SET balance = balance - ? "
                              "WHERE user_id = ? AND balance >= ?",
                              {duckdb::Value::BIGINT(amount), duckdb::Value(user_id),
                               duckdb::Value::BIGINT(amount)});
    if (changed == 0) {
      auto account = get(tx, user_id);
      throw LedgerError(ErrorKind::InsufficientFunds,
                        "insufficient funds: need " + fixed::format_cents(amount) + ", have " +
                            fixed::format_cents(account.balance));
    }
  }

  void credit(Tx &tx, const std::string &user_id, Cents amount) {
    check_amount(amount);
    if (amount == 0)
      return;

    int64_t changed = tx.exec("UPDATE accounts SET balance = balance + ? WHERE user_id = ?",
                              {duckdb::Value::BIGINT(amount), duckdb::Value(user_id)});
    if (changed == 0) {
      throw LedgerError(ErrorKind::NotFound, "unknown user " + user_id);
    }
  }

  Cents balance(Tx &tx, const std::string &user_id) { return get(tx, user_id).balance; }

  // ========================================================================
  // 原子操作
  // ========================================================================

  model::Account open_account(const std::string &user_id, const std::string &username,
                              Cents initial_balance) {
    if (user_id.empty()) {
      throw LedgerError(ErrorKind::InvalidArgument, "user id must not be empty");
    }
    check_amount(initial_balance);

    auto account = db_.transact([&](Tx &tx) {
      if (find(tx, user_id)) {
        throw LedgerError(ErrorKind::InvalidArgument, "user " + user_id + " already exists");
      }
      tx.exec("INSERT INTO accounts (user_id, username, balance, created_at) VALUES (?, ?, ?, ?)",
              {duckdb::Value(user_id), duckdb::Value(username.empty() ? user_id : username),
               duckdb::Value::BIGINT(initial_balance), duckdb::Value::BIGINT(now_ms())});
      return get(tx, user_id);
    });

    std::cout << "[Ledger] opened " << user_id << " balance=" << fixed::format_cents(initial_balance)
              << std::endl;
    return account;
  }

  model::Account account(const std::string &user_id) {
    return db_.transact([&](Tx &tx) { return get(tx, user_id); });
  }

  Cents deposit(const std::string &user_id, Cents amount) {
    if (amount <= 0) {
      throw LedgerError(ErrorKind::InvalidArgument, "deposit must be positive");
    }
    return db_.transact([&](Tx &tx) {
      credit(tx, user_id, amount);
      return balance(tx, user_id);
    });
  }

  // 生日格式 YYYY-MM-DD; 年龄 >= minimum_age 即通过
  bool verify_age(const std::string &user_id, const std::string &birthdate, int minimum_age) {
    int age = age_on(birthdate, today());
    bool adult = age >= minimum_age;

    db_.transact([&](Tx &tx) {
      get(tx, user_id);
      tx.exec("UPDATE accounts SET birthdate = ?, verified_adult = ? WHERE user_id = ?",
              {duckdb::Value(birthdate), duckdb::Value::BOOLEAN(adult), duckdb::Value(user_id)});
    });

    std::cout << "[Ledger] age check " << user_id << " age=" << age << (adult ? " verified" : " rejected")
              << std::endl;
    return adult;
  }

  struct Date {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
  };

  static Date parse_date(const std::string &text) {
    Date d;
    char tail = 0;
    if (text.size() != 10 ||
        std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &d.year, &d.month, &d.day, &tail) != 3) {
      throw LedgerError(ErrorKind::InvalidArgument, "birthdate must be YYYY-MM-DD");
    }
    std::chrono::year_month_day ymd{std::chrono::year{d.year}, std::chrono::month{d.month},
                                    std::chrono::day{d.day}};
    if (!ymd.ok()) {
      throw LedgerError(ErrorKind::InvalidArgument, "invalid birthdate " + text);
    }
    return d;
  }

  static int age_on(const std::string &birthdate, const Date &today) {
    Date b = parse_date(birthdate);
    int age = today.year - b.year;
    if (today.month < b.month || (today.month == b.month && today.day < b.day))
      --age;
    if (age < 0) {
      throw LedgerError(ErrorKind::InvalidArgument, "birthdate is in the future");
    }
    return age;
  }

  static Date today() {
    auto days = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    std::chrono::year_month_day ymd{days};
    return {static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
            static_cast<unsigned>(ymd.day())};
  }

private:
  static void check_amount(Cents amount) {
    if (amount < 0) {
      throw LedgerError(ErrorKind::InvalidArgument, "amount must not be negative");
    }
  }

  static model::Account to_account(Rows &rows, size_t r) {
    model::Account a;
    a.user_id = rows.get_string(r, 0);
    a.username = rows.get_string(r, 1);
    a.balance = rows.get_int(r, 2);
    a.birthdate = rows.get_string(r, 3);
    a.verified_adult = rows.get_bool(r, 4);
    a.created_at = rows.get_int(r, 5);
    return a;
  }

  Database &db_;
};

} // namespace ledger
