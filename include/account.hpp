/**
 * @file account.hpp
 * @brief One authenticated GitHub identity and its setup state machine.
 */

#ifndef FASTGH_ACCOUNT_HPP
#define FASTGH_ACCOUNT_HPP

#include "credential_store.hpp"
#include "device_flow.hpp"
#include "github_client.hpp"
#include "models.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace fastgh {

/**
 * Authentication state of an account slot.
 *
 * NoCredential -> AuthenticationPending -> Verifying -> Ready, with
 * AuthenticationPending -> Cancelled and Verifying -> NoCredential when the
 * stored token is rejected.
 */
enum class AuthState {
  NoCredential,
  AuthenticationPending,
  Verifying,
  Ready,
  Cancelled
};

/// Printable name of @p state.
const char *to_string(AuthState state);

/**
 * Ready account owning an authenticated API client.
 *
 * Domain operations are performed through api(); they return sentinels on
 * failure and may be called from worker threads concurrently.
 */
class Account {
public:
  Account(std::size_t slot, std::unique_ptr<GitHubClient> client,
          UserProfile profile);

  Account(const Account &) = delete;
  Account &operator=(const Account &) = delete;

  std::size_t slot() const { return slot_; }
  /// Only the session registry renumbers slots.
  void set_slot(std::size_t slot) { slot_ = slot; }

  const std::string &username() const { return profile_.login; }
  std::string display_name() const { return profile_.display_name(); }
  const UserProfile &profile() const { return profile_; }

  /// Always Ready: an Account exists only after successful verification.
  AuthState state() const { return AuthState::Ready; }

  GitHubClient &api() { return *client_; }

private:
  std::size_t slot_;
  std::unique_ptr<GitHubClient> client_;
  UserProfile profile_;
};

/// Setup ended because the user cancelled authorization.
struct SetupCancelled {
  std::string reason;
};

/// Setup ended with a terminal failure; the slot is unusable.
struct SetupFailed {
  std::string reason;
};

/// Result of AccountSetup::open().
using SetupResult =
    std::variant<std::shared_ptr<Account>, SetupCancelled, SetupFailed>;

/**
 * Drives an account slot from stored credential (or none) to Ready.
 *
 * A stored token is verified first. A rejected token is cleared and the
 * device flow runs; a token obtained from the device flow that is rejected
 * restarts the flow once more.
 */
class AccountSetup {
public:
  /// Creates the API client for a token.
  using ClientFactory =
      std::function<std::unique_ptr<GitHubClient>(const std::string &token)>;
  /// Runs the interactive authorization.
  using Authenticator = std::function<AuthOutcome()>;

  AccountSetup(CredentialStore &store, ClientFactory client_factory,
               Authenticator authenticator);

  /// Bring @p slot to Ready.
  SetupResult open(std::size_t slot);

  /// States visited by the last open() call.
  const std::vector<AuthState> &transitions() const { return transitions_; }

private:
  void enter(AuthState state);

  CredentialStore &store_;
  ClientFactory client_factory_;
  Authenticator authenticator_;
  std::vector<AuthState> transitions_;
};

} // namespace fastgh

#endif // FASTGH_ACCOUNT_HPP
