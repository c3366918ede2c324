#ifndef FASTGH_TESTS_FAKE_HTTP_CLIENT_HPP
#define FASTGH_TESTS_FAKE_HTTP_CLIENT_HPP

#include "http_client.hpp"
#include "task_runner.hpp"
#include "ui_dispatcher.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fastgh_test {

/// One request received by a FakeServer.
struct Request {
  std::string method;
  std::string url;
  std::string body;
  std::vector<std::string> headers;
};

/// Scriptable HTTP endpoint shared between a test and its fake clients.
class FakeServer {
public:
  using Handler = std::function<fastgh::HttpResponse(const Request &)>;

  explicit FakeServer(Handler handler = {}) : handler_(std::move(handler)) {}

  void set_handler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
  }

  fastgh::HttpResponse handle(Request req) {
    Handler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(req);
      handler = handler_;
    }
    if (!handler) {
      fastgh::HttpResponse res;
      res.status_code = 404;
      return res;
    }
    return handler(req);
  }

  std::vector<Request> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  /// Requests whose URL contains @p needle.
  std::size_t count(const std::string &needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto &r : requests_) {
      if (r.url.find(needle) != std::string::npos) {
        ++n;
      }
    }
    return n;
  }

private:
  mutable std::mutex mutex_;
  Handler handler_;
  std::vector<Request> requests_;
};

class FakeHttpClient : public fastgh::HttpClient {
public:
  explicit FakeHttpClient(std::shared_ptr<FakeServer> server)
      : server_(std::move(server)) {}

  fastgh::HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers) override {
    return server_->handle({"GET", url, {}, headers});
  }
  fastgh::HttpResponse post(const std::string &url, const std::string &data,
                            const std::vector<std::string> &headers) override {
    return server_->handle({"POST", url, data, headers});
  }
  fastgh::HttpResponse put(const std::string &url, const std::string &data,
                           const std::vector<std::string> &headers) override {
    return server_->handle({"PUT", url, data, headers});
  }
  fastgh::HttpResponse patch(const std::string &url, const std::string &data,
                             const std::vector<std::string> &headers) override {
    return server_->handle({"PATCH", url, data, headers});
  }
  fastgh::HttpResponse del(const std::string &url,
                           const std::vector<std::string> &headers) override {
    return server_->handle({"DELETE", url, {}, headers});
  }

private:
  std::shared_ptr<FakeServer> server_;
};

inline std::unique_ptr<fastgh::HttpClient>
fake_http(const std::shared_ptr<FakeServer> &server) {
  return std::make_unique<FakeHttpClient>(server);
}

inline fastgh::HttpResponse respond(long status, const std::string &body = {},
                                    std::vector<std::string> headers = {}) {
  fastgh::HttpResponse res;
  res.status_code = status;
  res.body = body;
  res.headers = std::move(headers);
  return res;
}

inline fastgh::HttpResponse respond_json(const nlohmann::json &j,
                                         long status = 200) {
  return respond(status, j.dump());
}

/// Run UI callbacks until no background request remains.
inline bool pump(fastgh::TaskRunner &runner, fastgh::UiDispatcher &ui,
                 std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    ui.drain();
    if (runner.in_flight() == 0 && ui.pending() == 0) {
      return true;
    }
    ui.wait_for_work(std::chrono::milliseconds(10));
  }
  return false;
}

} // namespace fastgh_test

#endif // FASTGH_TESTS_FAKE_HTTP_CLIENT_HPP
