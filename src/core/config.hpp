#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "fixed_point.hpp"

using json = nlohmann::json;

struct Config {
  std::string db_path = ":memory:";
  int api_port = 8080;

  // 投注规则
  fixed::Cents min_stake = 500;
  fixed::Odds standard_odds = 191; // 让分/大小分固定 -110
  int betting_close_minutes = 0;
  int max_parlay_legs = 10;
  bool require_age_verification = true;
  int minimum_age = 21;

  // 账户
  fixed::Cents initial_balance = 1000000;

  static Config defaults() { return Config{}; }

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
      throw std::runtime_error("cannot open config file: " + path);
    }

    json j;
    try {
      f >> j;
    } catch (const json::parse_error &e) {
      throw std::runtime_error("malformed config " + path + ": " + e.what());
    }

    auto require = [&](const char *key) -> const json & {
      if (!j.contains(key)) {
        throw std::runtime_error(std::string("config missing required field '") + key + "'");
      }
      return j[key];
    };

    Config config;
    config.db_path = require("db_path").get<std::string>();
    config.api_port = require("api_port").get<int>();

    if (j.contains("min_stake"))
      config.min_stake = fixed::cents(j["min_stake"].get<double>());
    if (j.contains("standard_odds"))
      config.standard_odds = fixed::odds(j["standard_odds"].get<double>());
    if (j.contains("betting_close_minutes"))
      config.betting_close_minutes = j["betting_close_minutes"].get<int>();
    if (j.contains("max_parlay_legs"))
      config.max_parlay_legs = j["max_parlay_legs"].get<int>();
    if (j.contains("require_age_verification"))
      config.require_age_verification = j["require_age_verification"].get<bool>();
    if (j.contains("minimum_age"))
      config.minimum_age = j["minimum_age"].get<int>();
    if (j.contains("initial_balance"))
      config.initial_balance = fixed::cents(j["initial_balance"].get<double>());

    config.validate();
    return config;
  }

  void validate() const {
    if (api_port <= 0 || api_port > 65535)
      throw std::runtime_error("api_port out of range");
    if (min_stake <= 0)
      throw std::runtime_error("min_stake must be positive");
    if (standard_odds <= fixed::ODDS_SCALE)
      throw std::runtime_error("standard_odds must be greater than 1.00");
    if (standard_odds > fixed::MAX_ODDS)
      throw std::runtime_error("standard_odds must not exceed 1000.00");
    if (betting_close_minutes < 0)
      throw std::runtime_error("betting_close_minutes must not be negative");
    if (max_parlay_legs < 2)
      throw std::runtime_error("max_parlay_legs must be at least 2");
    if (initial_balance < 0)
      throw std::runtime_error("initial_balance must not be negative");
  }
};
