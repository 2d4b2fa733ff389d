#ifndef LANSHARE_NET_IO_THREAD_HPP
#define LANSHARE_NET_IO_THREAD_HPP

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <thread>

namespace lanshare {

// Runs an io_context on a background thread until destroyed.
class IoThread {
public:
  explicit IoThread(boost::asio::io_context &io)
      : io_(io), work_(boost::asio::make_work_guard(io)),
        thread_([this]() { io_.run(); }) {}

  ~IoThread() { stop(); }

  // Stops the io_context and joins the thread. Handlers still queued are
  // never run.
  void stop() {
    work_.reset();
    io_.stop();
    if (thread_.joinable())
      thread_.join();
  }

  IoThread(const IoThread &) = delete;
  IoThread &operator=(const IoThread &) = delete;

private:
  boost::asio::io_context &io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_;
  std::thread thread_;
};

} // namespace lanshare

#endif
