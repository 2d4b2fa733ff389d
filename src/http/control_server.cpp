#include "control_server.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/http.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>

namespace lanshare {

namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr size_t kMaxRequestBody = 2 * 1024 * 1024;

// One keep-alive connection; requests are handled one at a time.
class session : public std::enable_shared_from_this<session> {
  tcp::socket socket_;
  ControlApi &api_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;

public:
  session(tcp::socket &&socket, ControlApi &api)
      : socket_(std::move(socket)), api_(api) {}

  void run() { do_read(); }

private:
  void do_read() {
    parser_.emplace();
    parser_->body_limit(kMaxRequestBody);
    http::async_read(
        socket_, buffer_, *parser_,
        beast::bind_front_handler(&session::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);
    if (ec == http::error::end_of_stream)
      return do_close();
    if (ec) {
      std::cerr << "[Control] read: " << ec.message() << "\n";
      return;
    }

    auto req = parser_->release();
    // Acknowledged sends answer from the room strand; hop back to the socket.
    api_.handle(req, [self = shared_from_this()](HttpResponse res) {
      net::post(self->socket_.get_executor(),
                [self, res = std::move(res)]() mutable {
                  self->send_response(std::move(res));
                });
    });
  }

  void send_response(HttpResponse &&res) {
    auto sp = std::make_shared<HttpResponse>(std::move(res));
    http::async_write(socket_, *sp,
                      [self = shared_from_this(), sp](beast::error_code ec,
                                                      std::size_t bytes) {
                        self->on_write(ec, bytes, sp->keep_alive());
                      });
  }

  void on_write(beast::error_code ec, std::size_t bytes_transferred,
                bool keep_alive) {
    boost::ignore_unused(bytes_transferred);
    if (ec) {
      std::cerr << "[Control] write: " << ec.message() << "\n";
      return;
    }
    if (keep_alive)
      do_read();
    else
      do_close();
  }

  void do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
  }
};

} // namespace

ControlServer::ControlServer(ControlApi &api, std::string address,
                             unsigned short port)
    : api_(api), address_(std::move(address)), port_(port), ioc_(1),
      signals_(ioc_, SIGINT, SIGTERM),
      acceptor_(ioc_, {net::ip::make_address(address_), port_}) {
  port_ = acceptor_.local_endpoint().port();
  signals_.async_wait([this](boost::system::error_code ec, int signal) {
    if (ec)
      return;
    std::cout << "[Control] Caught signal " << signal << ", shutting down"
              << std::endl;
    if (on_signal_)
      on_signal_(signal);
    stop();
  });
}

void ControlServer::run() {
  std::cout << "[Control] Listening on http://" << address_ << ":" << port_
            << std::endl;
  do_accept();
  ioc_.run();
}

void ControlServer::stop() {
  net::post(ioc_, [this]() {
    beast::error_code ec;
    acceptor_.close(ec);
    signals_.cancel(ec);
    ioc_.stop();
  });
}

void ControlServer::do_accept() {
  acceptor_.async_accept(
      net::make_strand(ioc_),
      beast::bind_front_handler(&ControlServer::on_accept, this));
}

void ControlServer::on_accept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    if (ec != net::error::operation_aborted)
      std::cerr << "[Control] accept: " << ec.message() << "\n";
    return;
  }

  boost::system::error_code ec_opt;
  socket.set_option(tcp::no_delay(true), ec_opt);

  std::make_shared<session>(std::move(socket), api_)->run();
  do_accept();
}

} // namespace lanshare
