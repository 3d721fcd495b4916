#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

#include "api/api_server.hpp"
#include "core/config.hpp"
#include "core/database.hpp"
#include "exchange.hpp"

void print_usage(const char *prog) {
  std::cout << "用法: " << prog << " --config <config.json>" << std::endl;
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else {
      std::cerr << "[Main] 未知参数: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    Fantasy Ledger" << std::endl;
  std::cout << "========================================" << std::endl;

  Config config;
  try {
    config = Config::load(config_path);
  } catch (const std::exception &e) {
    std::cerr << "[Main] " << e.what() << std::endl;
    return 1;
  }

  std::cout << "[Main] DB Path: " << config.db_path << std::endl;
  std::cout << "[Main] API Port: " << config.api_port << std::endl;
  std::cout << "[Main] Min Stake: " << fixed::format_cents(config.min_stake) << std::endl;
  std::cout << "[Main] Age Gate: " << (config.require_age_verification ? std::to_string(config.minimum_age) : "off")
            << std::endl;

  Database db(config.db_path);
  db.init_schema();

  Exchange exchange(db, config);

  boost::asio::io_context api_ioc;
  ApiServer api_server(api_ioc, exchange, static_cast<unsigned short>(config.api_port));

  boost::asio::signal_set signals(api_ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &, int) {
    std::cout << "\n[Main] 正在关闭..." << std::endl;
    api_ioc.stop();
  });

  std::cout << "[Main] 服务已启动" << std::endl;
  api_ioc.run();

  std::cout << "[Main] 已退出" << std::endl;
  return 0;
}
