#pragma once
#include <atomic>
#include <exception>
#include <string>

#include <httplib.h>

#include "control_api.hpp"

// HTTP route table over cpp-httplib. Routes forward into ControlApi and Broadcaster.
class StreamServer {
public:
  explicit StreamServer(StreamContext& ctx);
  ~StreamServer();

  bool listen(const std::string& host, int port);  // blocks until stop()
  void stop();
  bool is_running() const { return svr_.is_running(); }

  // Split form of listen(): bind an ephemeral port first, then serve on it.
  int bind_to_any_port(const std::string& host);
  bool listen_after_bind();

  // Uncaught handler errors become a 500 JSON body.
  static void report_exception(const httplib::Request& req, httplib::Response& res,
                               std::exception_ptr ep);

private:
  void register_routes();
  static void reply(httplib::Response& res, const ApiResult& r);

  StreamContext& ctx_;
  ControlApi api_;
  httplib::Server svr_;
  std::atomic<bool> streaming_{true};
};
