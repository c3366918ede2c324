/**
 * @file device_flow.cpp
 * @brief Device authorization flow implementation.
 */

#include "device_flow.hpp"
#include "browser.hpp"
#include "log.hpp"
#include "version.hpp"

#include <nlohmann/json.hpp>
#include <ostream>
#include <thread>
#include <utility>
#include <vector>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> auth_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("auth");
  }();
  return logger;
}

constexpr std::chrono::seconds kSlowDownStep{5};

std::string json_string(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  return it != j.end() && it->is_string() ? it->get<std::string>()
                                          : std::string();
}

std::chrono::seconds json_seconds(const nlohmann::json &j, const char *key,
                                  std::chrono::seconds fallback) {
  auto it = j.find(key);
  if (it != j.end() && it->is_number_integer() && it->get<long long>() > 0) {
    return std::chrono::seconds(it->get<long long>());
  }
  return fallback;
}

} // namespace

ConsoleDevicePrompt::ConsoleDevicePrompt(std::ostream &out, bool open_browser)
    : out_(out), open_browser_(open_browser) {}

bool ConsoleDevicePrompt::present(const DeviceCode &code) {
  out_ << "To sign in, open " << code.verification_uri
       << " and enter the code " << code.user_code << '\n';
  if (copy_to_clipboard(code.user_code)) {
    out_ << "(The code has been copied to the clipboard.)\n";
  }
  if (open_browser_) {
    open_url(code.verification_uri);
  }
  out_ << "Waiting for authorization..." << std::endl;
  return true;
}

bool ConsoleDevicePrompt::keep_waiting(std::chrono::seconds elapsed,
                                       std::chrono::seconds expires_in) {
  auth_log()->debug("Waiting for authorization ({}s of {}s)", elapsed.count(),
                    expires_in.count());
  return true;
}

DeviceFlowAuthenticator::DeviceFlowAuthenticator(
    std::unique_ptr<HttpClient> http, std::string client_id,
    std::string login_base, std::string scope)
    : http_(std::move(http)), client_id_(std::move(client_id)),
      login_base_(std::move(login_base)), scope_(std::move(scope)),
      sleep_([](std::chrono::seconds d) { std::this_thread::sleep_for(d); }),
      clock_([] { return std::chrono::steady_clock::now(); }) {
  if (!http_) {
    http_ = std::make_unique<CurlHttpClient>(30000, kUserAgent);
  }
  while (!login_base_.empty() && login_base_.back() == '/') {
    login_base_.pop_back();
  }
}

void DeviceFlowAuthenticator::set_sleep_function(SleepFunction sleep) {
  sleep_ = std::move(sleep);
}

void DeviceFlowAuthenticator::set_clock(Clock clock) {
  clock_ = std::move(clock);
}

std::vector<std::string> DeviceFlowAuthenticator::form_headers() const {
  return {"Accept: application/json",
          "Content-Type: application/x-www-form-urlencoded"};
}

std::optional<DeviceCode>
DeviceFlowAuthenticator::request_code(std::string *error) {
  auto fail = [&](std::string reason) -> std::optional<DeviceCode> {
    auth_log()->error("Device code request failed: {}", reason);
    if (error != nullptr) {
      *error = std::move(reason);
    }
    return std::nullopt;
  };
  HttpResponse res;
  try {
    res = http_->post(login_base_ + "/login/device/code",
                      "client_id=" + url_encode(client_id_) +
                          "&scope=" + url_encode(scope_),
                      form_headers());
  } catch (const std::exception &e) {
    return fail(e.what());
  }
  if (res.status_code != 200) {
    return fail("HTTP " + std::to_string(res.status_code));
  }
  nlohmann::json j = nlohmann::json::parse(res.body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return fail("malformed response");
  }
  DeviceCode code;
  code.device_code = json_string(j, "device_code");
  code.user_code = json_string(j, "user_code");
  code.verification_uri = json_string(j, "verification_uri");
  code.expires_in = json_seconds(j, "expires_in", code.expires_in);
  code.interval = json_seconds(j, "interval", code.interval);
  if (code.device_code.empty() || code.user_code.empty() ||
      code.verification_uri.empty()) {
    return fail("response is missing device_code, user_code or "
                "verification_uri");
  }
  auth_log()->info("Device code issued; expires in {}s",
                   code.expires_in.count());
  return code;
}

AuthOutcome DeviceFlowAuthenticator::authenticate(DevicePrompt &prompt) {
  std::string error;
  auto code = request_code(&error);
  if (!code) {
    return AuthFailed{error};
  }
  if (!prompt.present(*code)) {
    auth_log()->info("Sign-in declined by user");
    return AuthCancelled{"Sign-in cancelled"};
  }
  return poll(*code, prompt);
}

AuthOutcome DeviceFlowAuthenticator::poll(const DeviceCode &code,
                                          DevicePrompt &prompt) {
  const std::string body =
      "client_id=" + url_encode(client_id_) +
      "&device_code=" + url_encode(code.device_code) +
      "&grant_type=" + url_encode("urn:ietf:params:oauth:grant-type:device_code");
  const auto start = clock_();
  std::chrono::seconds interval = code.interval;
  while (true) {
    sleep_(interval);
    auto elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(clock_() - start);
    if (elapsed >= code.expires_in) {
      auth_log()->warn("Device code expired after {}s", elapsed.count());
      return AuthCancelled{"Device code expired"};
    }
    if (!prompt.keep_waiting(elapsed, code.expires_in)) {
      auth_log()->info("Sign-in cancelled while waiting");
      return AuthCancelled{"Sign-in cancelled"};
    }
    HttpResponse res;
    try {
      res = http_->post(login_base_ + "/login/oauth/access_token", body,
                        form_headers());
    } catch (const std::exception &e) {
      auth_log()->warn("Token poll failed: {}", e.what());
      continue;
    }
    nlohmann::json j = nlohmann::json::parse(res.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      auth_log()->warn("Token poll returned HTTP {} without JSON",
                       res.status_code);
      continue;
    }
    std::string token = json_string(j, "access_token");
    if (!token.empty()) {
      auth_log()->info("Access token issued");
      return AuthSuccess{token};
    }
    const std::string err = json_string(j, "error");
    if (err == "authorization_pending") {
      continue;
    }
    if (err == "slow_down") {
      interval = json_seconds(j, "interval", interval + kSlowDownStep);
      auth_log()->debug("Slowing down polling to {}s", interval.count());
      continue;
    }
    std::string description = json_string(j, "error_description");
    if (description.empty()) {
      description = err.empty() ? "HTTP " + std::to_string(res.status_code)
                                : err;
    }
    if (err == "expired_token" || err == "access_denied") {
      auth_log()->warn("Sign-in ended: {}", description);
      return AuthCancelled{description};
    }
    auth_log()->error("Sign-in failed: {}", description);
    return AuthFailed{description};
  }
}

} // namespace fastgh
