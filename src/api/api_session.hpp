#pragma once

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>

#include "../exchange.hpp"
#include "json_codec.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

// ============================================================================
// ErrorKind -> HTTP 状态码
// ============================================================================
inline http::status status_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return http::status::not_found;
  case ErrorKind::InsufficientFunds:
  case ErrorKind::InsufficientHoldings:
  case ErrorKind::BettingClosed:
  case ErrorKind::AlreadySettled:
  case ErrorKind::StaleOffer:
    return http::status::conflict;
  case ErrorKind::InvalidStake:
  case ErrorKind::InvalidSelection:
  case ErrorKind::InvalidArgument:
    return http::status::unprocessable_entity;
  case ErrorKind::NotAuthorized:
  case ErrorKind::AgeVerificationRequired:
    return http::status::forbidden;
  case ErrorKind::Storage:
    return http::status::internal_server_error;
  }
  return http::status::internal_server_error;
}

// ============================================================================
// 请求目标解析
// ============================================================================

// 非法的 %xx 原样保留
inline std::string url_decode(const std::string &str) {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };

  std::string result;
  for (size_t i = 0; i < str.size(); ++i) {
    if (str[i] == '%' && i + 2 < str.size() && hex(str[i + 1]) >= 0 && hex(str[i + 2]) >= 0) {
      result += static_cast<char>(hex(str[i + 1]) * 16 + hex(str[i + 2]));
      i += 2;
    } else if (str[i] == '+') {
      result += ' ';
    } else {
      result += str[i];
    }
  }
  return result;
}

// "/api/accounts/alice/holdings?x=1" -> ["api", "accounts", "alice", "holdings"]
inline std::vector<std::string> split_path(const std::string &target) {
  std::string path = target.substr(0, target.find('?'));
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos)
      end = path.size();
    if (end > start)
      out.push_back(url_decode(path.substr(start, end - start)));
    start = end + 1;
  }
  return out;
}

inline std::string query_param(const std::string &target, const char *name) {
  auto q = target.find('?');
  if (q == std::string::npos)
    return "";
  std::string query = target.substr(q + 1);
  std::string key = std::string(name) + "=";
  size_t pos = 0;
  while (pos < query.size()) {
    size_t amp = query.find('&', pos);
    if (amp == std::string::npos)
      amp = query.size();
    if (query.compare(pos, key.size(), key) == 0)
      return url_decode(query.substr(pos + key.size(), amp - pos - key.size()));
    pos = amp + 1;
  }
  return "";
}

inline int64_t parse_id(const std::string &text) {
  if (text.empty() || text.size() > 18 || text.find_first_not_of("0123456789") != std::string::npos) {
    throw LedgerError(ErrorKind::InvalidArgument, "invalid id '" + text + "'");
  }
  return std::stoll(text);
}

// ?limit=N, 缺省取 fallback
inline int parse_limit(const std::string &text, int fallback) {
  if (text.empty())
    return fallback;
  if (text.size() > 6 || text.find_first_not_of("0123456789") != std::string::npos || std::stoi(text) <= 0) {
    throw LedgerError(ErrorKind::InvalidArgument, "limit must be a positive integer, got '" + text + "'");
  }
  return std::stoi(text);
}

class ApiSession : public std::enable_shared_from_this<ApiSession> {
public:
  ApiSession(tcp::socket socket, Exchange &exchange) : socket_(std::move(socket)), ex_(exchange) {}

  void run() { do_read(); }

private:
  void do_read() {
    req_ = {};
    http::async_read(socket_, buffer_, req_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t) {
                       if (ec)
                         return;
                       self->handle_request();
                     });
  }

  void handle_request() {
    res_ = {};
    res_.version(req_.version());
    res_.keep_alive(req_.keep_alive());

    res_.set(http::field::access_control_allow_origin, "*");
    res_.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res_.set(http::field::access_control_allow_headers, "Content-Type");
    res_.set(http::field::content_type, "application/json");

    if (req_.method() == http::verb::options) {
      res_.result(http::status::ok);
      return do_write();
    }

    std::string target(req_.target());
    bool post = req_.method() == http::verb::post;

    try {
      auto path = split_path(target);
      if (path.size() < 2 || path[0] != "api") {
        not_found();
      } else if (path[1] == "health") {
        reply(http::status::ok, {{"status", "ok"}});
      } else if (path[1] == "accounts") {
        route_accounts(path, post);
      } else if (path[1] == "trades" && path.size() == 2 && post) {
        handle_trade();
      } else if (path[1] == "games") {
        route_games(path, post);
      } else if (path[1] == "bets") {
        route_bets(path, post);
      } else if (path[1] == "parlays" && path.size() == 2 && post) {
        handle_create_parlay();
      } else if (path[1] == "offers") {
        route_offers(path, post);
      } else {
        not_found();
      }
    } catch (const LedgerError &e) {
      std::cerr << "[HTTP] " << req_.method_string() << " " << target << " -> " << e.kind_name() << ": "
                << e.what() << std::endl;
      reply(status_for(e.kind()), {{"error", e.kind_name()}, {"message", e.what()}});
    } catch (const json::exception &e) {
      reply(http::status::bad_request, {{"error", "bad_request"}, {"message", e.what()}});
    } catch (const std::logic_error &e) {
      reply(http::status::bad_request, {{"error", "bad_request"}, {"message", e.what()}});
    } catch (const std::exception &e) {
      std::cerr << "[HTTP] " << req_.method_string() << " " << target << " -> " << e.what() << std::endl;
      reply(http::status::internal_server_error, {{"error", "internal"}, {"message", e.what()}});
    }

    res_.prepare_payload();
    do_write();
  }

  // ==========================================================================
  // /api/accounts
  // ==========================================================================
  void route_accounts(const std::vector<std::string> &path, bool post) {
    if (path.size() == 2 && post) {
      json body = parse_body();
      auto account = ex_.open_account(codec::get_string(body, "user_id"),
                                      codec::opt_string(body, "username").value_or(""),
                                      codec::opt_fixed(body, "initial_balance", fixed::CENTS_PER_UNIT));
      return reply(http::status::created, codec::to_json(account));
    }
    if (path.size() == 3 && !post)
      return reply(http::status::ok, codec::to_json(ex_.accounts().account(path[2])));
    if (path.size() != 4)
      return not_found();

    const std::string &user = path[2];
    const std::string &what = path[3];

    if (post && what == "deposit") {
      json body = parse_body();
      auto balance = ex_.accounts().deposit(user, codec::get_fixed(body, "amount", fixed::CENTS_PER_UNIT));
      reply(http::status::ok, {{"user_id", user}, {"balance", codec::money(balance)}});
    } else if (post && what == "verify-age") {
      json body = parse_body();
      bool adult = ex_.verify_age(user, codec::get_string(body, "birthdate"));
      reply(http::status::ok, {{"user_id", user}, {"verified_adult", adult}});
    } else if (!post && what == "holdings") {
      reply(http::status::ok, codec::to_json_array(ex_.holdings().holdings(user)));
    } else if (!post && what == "transactions") {
      int limit = parse_limit(get_param("limit"), 500);
      reply(http::status::ok, codec::to_json_array(ex_.log().history(user, limit)));
    } else if (!post && what == "summary") {
      reply(http::status::ok, codec::to_json(ex_.log().summary(user)));
    } else if (!post && what == "bets") {
      reply(http::status::ok, codec::to_json(ex_.user_bets(user)));
    } else if (!post && what == "offers") {
      reply(http::status::ok, codec::to_json_array(ex_.offers().pending_offers(user)));
    } else {
      not_found();
    }
  }

  void handle_trade() {
    json body = parse_body();
    auto receipt = ex_.trades().execute_trade(
        codec::get_string(body, "user_id"), codec::asset_ref(body), codec::get_enum<model::Side>(body, "side"),
        codec::get_fixed(body, "unit_price", fixed::CENTS_PER_UNIT),
        codec::get_fixed(body, "quantity", fixed::QTY_SCALE));
    reply(http::status::ok, codec::to_json(receipt));
  }

  // ==========================================================================
  // /api/games
  // ==========================================================================
  void route_games(const std::vector<std::string> &path, bool post) {
    if (path.size() == 2 && post) {
      int64_t id = ex_.games().add_game(codec::game(parse_body()));
      return reply(http::status::created, codec::to_json(ex_.games().get_game(id)));
    }
    if (path.size() == 2) {
      int limit = parse_limit(get_param("limit"), 50);
      return reply(http::status::ok, codec::to_json_array(ex_.games().upcoming_games(limit)));
    }
    int64_t game_id = parse_id(path[2]);
    if (path.size() == 3 && !post)
      return reply(http::status::ok, codec::to_json(ex_.games().get_game(game_id)));
    if (path.size() == 4 && post && path[3] == "settle") {
      json body = parse_body();
      auto report = ex_.settlement().settle_game(game_id, codec::get_int32(body, "home_score"),
                                                 codec::get_int32(body, "away_score"));
      return reply(http::status::ok, codec::to_json(report));
    }
    not_found();
  }

  // ==========================================================================
  // /api/bets, /api/parlays
  // ==========================================================================
  void route_bets(const std::vector<std::string> &path, bool post) {
    if (!post)
      return not_found();
    json body = parse_body();
    if (path.size() == 2) {
      auto bet = ex_.bets().place_bet(codec::get_string(body, "user_id"), codec::selection(body),
                                      codec::get_fixed(body, "stake", fixed::CENTS_PER_UNIT));
      return reply(http::status::created, codec::to_json(bet));
    }
    if (path.size() == 4 && path[3] == "cancel") {
      auto bet = ex_.bets().cancel_bet(parse_id(path[2]), codec::get_string(body, "user_id"));
      return reply(http::status::ok, codec::to_json(bet));
    }
    not_found();
  }

  void handle_create_parlay() {
    json body = parse_body();
    const json &legs = codec::field(body, "legs");
    if (!legs.is_array()) {
      throw LedgerError(ErrorKind::InvalidArgument, "field 'legs' must be an array");
    }
    std::vector<model::Selection> selections;
    for (const auto &leg : legs)
      selections.push_back(codec::selection(leg));

    auto parlay = ex_.parlays().create_parlay(codec::get_string(body, "user_id"), selections,
                                              codec::get_fixed(body, "stake", fixed::CENTS_PER_UNIT));
    reply(http::status::created, codec::to_json(parlay));
  }

  // ==========================================================================
  // /api/offers
  // ==========================================================================
  void route_offers(const std::vector<std::string> &path, bool post) {
    if (!post)
      return not_found();
    json body = parse_body();
    if (path.size() == 2) {
      auto offer = ex_.offers().create_offer(
          codec::get_string(body, "initiator"), codec::offer_assets(body, "offered"),
          codec::offer_assets(body, "requested"), codec::opt_string(body, "counterparty"),
          codec::opt_string(body, "note").value_or(""));
      return reply(http::status::created, codec::to_json(offer));
    }
    if (path.size() != 4)
      return not_found();

    int64_t offer_id = parse_id(path[2]);
    std::string user = codec::get_string(body, "user_id");
    if (path[3] == "accept")
      reply(http::status::ok, codec::to_json(ex_.offers().accept_offer(offer_id, user)));
    else if (path[3] == "reject")
      reply(http::status::ok, codec::to_json(ex_.offers().reject_offer(offer_id, user)));
    else if (path[3] == "cancel")
      reply(http::status::ok, codec::to_json(ex_.offers().cancel_offer(offer_id, user)));
    else
      not_found();
  }

  // ==========================================================================
  // helpers
  // ==========================================================================
  void reply(http::status status, const json &body) {
    res_.result(status);
    res_.body() = body.dump();
  }

  void not_found() { reply(http::status::not_found, {{"error", "not_found"}}); }

  json parse_body() {
    if (req_.body().empty())
      return json::object();
    return json::parse(req_.body());
  }

  std::string get_param(const char *name) const { return query_param(std::string(req_.target()), name); }

  void do_write() {
    http::async_write(socket_, res_,
                      [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (!ec && self->res_.keep_alive()) {
                          self->do_read();
                        } else {
                          beast::error_code shutdown_ec;
                          self->socket_.shutdown(tcp::socket::shutdown_send, shutdown_ec);
                        }
                      });
  }

  tcp::socket socket_;
  Exchange &ex_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  http::response<http::string_body> res_;
};
