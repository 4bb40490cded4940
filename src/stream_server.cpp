#include "stream_server.hpp"

#include <spdlog/spdlog.h>

StreamServer::StreamServer(StreamContext& ctx) : ctx_(ctx), api_(ctx) {
  // One worker per streaming client plus headroom for control requests.
  const size_t workers = static_cast<size_t>(ctx_.broadcaster.max_clients()) + 4;
  svr_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
  register_routes();
}

StreamServer::~StreamServer() { stop(); }

void StreamServer::reply(httplib::Response& res, const ApiResult& r) {
  res.status = r.status;
  res.set_content(r.body.dump(), "application/json");
}

void StreamServer::register_routes() {
  svr_.Get("/", [this](const httplib::Request&, httplib::Response& res) {
    res.set_content(api_.index_html(), "text/html");
  });

  svr_.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr_.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
    reply(res, api_.status());
  });

  svr_.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
    res.set_content(api_.metrics_text(), "text/plain; version=0.0.4");
  });

  svr_.Get("/video_feed", [this](const httplib::Request&, httplib::Response& res) {
    auto session = ctx_.broadcaster.try_acquire();
    if (!session) {
      res.status = 503;
      res.set_content("too many clients", "text/plain");
      return;
    }
    res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
    res.set_header("Pragma", "no-cache");
    res.set_header("Connection", "close");
    // The provider owns the session; its slot is released when httplib drops the provider.
    res.set_chunked_content_provider(
        ctx_.broadcaster.content_type(),
        [this, session](size_t, httplib::DataSink& sink) {
          ctx_.broadcaster.stream(
              *session, [&sink](const char* d, size_t n) { return sink.write(d, n); },
              streaming_);
          return false;
        },
        [session](bool) {});
  });

  svr_.Post("/reset_camera", [this](const httplib::Request&, httplib::Response& res) {
    reply(res, api_.reset_camera());
  });

  svr_.Post("/toggle_night_vision", [this](const httplib::Request&, httplib::Response& res) {
    reply(res, api_.toggle_night_vision());
  });

  svr_.Post("/toggle_night_vision_mode", [this](const httplib::Request&, httplib::Response& res) {
    reply(res, api_.toggle_night_vision_mode());
  });

  svr_.Post("/toggle_green_night_vision", [this](const httplib::Request&, httplib::Response& res) {
    reply(res, api_.toggle_green_night_vision());
  });

  svr_.Post("/set_night_vision_manual", [this](const httplib::Request& req, httplib::Response& res) {
    reply(res, api_.set_night_vision_manual(req.body));
  });

  svr_.Post("/set_night_vision_strength",
            [this](const httplib::Request& req, httplib::Response& res) {
              reply(res, api_.set_night_vision_strength(req.body));
            });

  svr_.Post("/set_light_threshold", [this](const httplib::Request& req, httplib::Response& res) {
    reply(res, api_.set_light_threshold(req.body));
  });

  svr_.set_exception_handler(&StreamServer::report_exception);
}

void StreamServer::report_exception(const httplib::Request& req, httplib::Response& res,
                                    std::exception_ptr ep) {
  std::string what = "unknown error";
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    what = e.what();
  } catch (...) {
    // non-standard exception type; reported as "unknown error"
  }
  spdlog::error("Request {} {} failed: {}", req.method, req.path, what);
  res.status = 500;
  res.set_content(nlohmann::json{{"success", false}, {"message", what}}.dump(),
                  "application/json");
}

bool StreamServer::listen(const std::string& host, int port) {
  streaming_ = true;
  spdlog::info("HTTP server listening on {}:{}", host, port);
  return svr_.listen(host, port);
}

int StreamServer::bind_to_any_port(const std::string& host) {
  const int port = svr_.bind_to_any_port(host);
  if (port > 0) spdlog::info("HTTP server bound to {}:{}", host, port);
  return port;
}

bool StreamServer::listen_after_bind() {
  streaming_ = true;
  return svr_.listen_after_bind();
}

void StreamServer::stop() {
  streaming_ = false;
  if (svr_.is_running()) svr_.stop();
}
