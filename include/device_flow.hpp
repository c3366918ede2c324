/**
 * @file device_flow.hpp
 * @brief OAuth device authorization flow.
 *
 * The user authorizes the application in a browser with a short code while
 * the client polls the token endpoint. No local redirect listener is needed.
 */

#ifndef FASTGH_DEVICE_FLOW_HPP
#define FASTGH_DEVICE_FLOW_HPP

#include "http_client.hpp"

#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fastgh {

/// OAuth application id used when none is configured.
inline constexpr const char *kDefaultClientId = "Ov23liErbWGLzAKTlLFW";

/// Scopes requested for new tokens.
inline constexpr const char *kDefaultScope = "repo user notifications";

/** Device and user code issued by the identity provider. */
struct DeviceCode {
  std::string device_code;
  std::string user_code;        ///< Code the user types in the browser
  std::string verification_uri; ///< Page where the code is entered
  std::chrono::seconds expires_in{900};
  std::chrono::seconds interval{5}; ///< Minimum delay between polls
};

/** Presents the user code and lets the user abort the wait. */
class DevicePrompt {
public:
  virtual ~DevicePrompt() = default;

  /**
   * Show the code to the user.
   *
   * @return `false` when the user declined to continue.
   */
  virtual bool present(const DeviceCode &code) = 0;

  /**
   * Called before every poll.
   *
   * @return `false` to cancel the flow.
   */
  virtual bool keep_waiting(std::chrono::seconds elapsed,
                            std::chrono::seconds expires_in) = 0;
};

/**
 * Prompt writing to a stream. The code is copied to the clipboard and the
 * verification page opened in the browser.
 */
class ConsoleDevicePrompt : public DevicePrompt {
public:
  explicit ConsoleDevicePrompt(std::ostream &out, bool open_browser = true);

  bool present(const DeviceCode &code) override;
  bool keep_waiting(std::chrono::seconds elapsed,
                    std::chrono::seconds expires_in) override;

private:
  std::ostream &out_;
  bool open_browser_;
};

/// Token issued by the provider.
struct AuthSuccess {
  std::string access_token;
};

/// The user declined, the code expired or access was denied.
struct AuthCancelled {
  std::string reason;
};

/// Protocol or transport failure.
struct AuthFailed {
  std::string reason;
};

/// Outcome of DeviceFlowAuthenticator::authenticate().
using AuthOutcome = std::variant<AuthSuccess, AuthCancelled, AuthFailed>;

/** Runs the device authorization flow against one identity provider. */
class DeviceFlowAuthenticator {
public:
  using SleepFunction = std::function<void(std::chrono::seconds)>;
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  /**
   * @param http Transport; a CurlHttpClient when null.
   * @param client_id OAuth application id.
   * @param login_base Base URL of the identity provider.
   */
  explicit DeviceFlowAuthenticator(std::unique_ptr<HttpClient> http = nullptr,
                                   std::string client_id = kDefaultClientId,
                                   std::string login_base = "https://github.com",
                                   std::string scope = kDefaultScope);

  /// Replace the sleep between polls.
  void set_sleep_function(SleepFunction sleep);

  /// Replace the clock measuring the expiry window.
  void set_clock(Clock clock);

  /**
   * Request a device code.
   *
   * @param error Receives the failure reason.
   */
  std::optional<DeviceCode> request_code(std::string *error = nullptr);

  /// Request a code, present it and poll until a terminal outcome.
  AuthOutcome authenticate(DevicePrompt &prompt);

  /// Poll for @p code until a terminal outcome.
  AuthOutcome poll(const DeviceCode &code, DevicePrompt &prompt);

private:
  std::vector<std::string> form_headers() const;

  std::unique_ptr<HttpClient> http_;
  std::string client_id_;
  std::string login_base_;
  std::string scope_;
  SleepFunction sleep_;
  Clock clock_;
};

} // namespace fastgh

#endif // FASTGH_DEVICE_FLOW_HPP
