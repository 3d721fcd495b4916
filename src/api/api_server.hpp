#pragma once

// ============================================================================
// ApiServer - HTTP 服务器, 每个连接一个 ApiSession
// ============================================================================

#include <iostream>
#include <memory>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "../exchange.hpp"
#include "api_session.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

class ApiServer {
public:
  ApiServer(asio::io_context &ioc, Exchange &exchange, unsigned short port)
      : acceptor_(ioc, tcp::endpoint(tcp::v4(), port)), exchange_(exchange) {
    std::cout << "[HTTP] 监听端口 " << port << std::endl;
    do_accept();
  }

private:
  void do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (!ec) {
        std::make_shared<ApiSession>(std::move(socket), exchange_)->run();
      } else {
        std::cerr << "[HTTP] accept: " << ec.message() << std::endl;
      }
      do_accept();
    });
  }

  tcp::acceptor acceptor_;
  Exchange &exchange_;
};
