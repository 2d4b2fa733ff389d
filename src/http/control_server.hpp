#ifndef LANSHARE_HTTP_CONTROL_SERVER_HPP
#define LANSHARE_HTTP_CONTROL_SERVER_HPP

#include "control_api.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core.hpp>
#include <functional>
#include <string>

namespace lanshare {

namespace beast = boost::beast;
namespace net = boost::asio;

// HTTP/1.1 front end for ControlApi. run() serves on the calling thread
// until stop() or SIGINT/SIGTERM.
class ControlServer {
public:
  ControlServer(ControlApi &api, std::string address, unsigned short port);

  void run();
  void stop();

  // Called once when a signal stops the server.
  void on_signal(std::function<void(int)> cb) { on_signal_ = std::move(cb); }

  net::io_context &io_context() { return ioc_; }
  unsigned short port() const { return port_; }

private:
  void do_accept();
  void on_accept(beast::error_code ec, net::ip::tcp::socket socket);

  ControlApi &api_;
  std::string address_;
  unsigned short port_;
  net::io_context ioc_;
  net::signal_set signals_;
  net::ip::tcp::acceptor acceptor_;
  std::function<void(int)> on_signal_;
};

} // namespace lanshare

#endif
