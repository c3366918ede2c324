#include "account.hpp"
#include "log.hpp"

#include <optional>
#include <utility>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> accounts_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("accounts");
  }();
  return logger;
}

/// Device flow runs allowed per open(): the first plus one restart.
constexpr int kMaxAuthorizations = 2;

} // namespace

const char *to_string(AuthState state) {
  switch (state) {
  case AuthState::NoCredential:
    return "NoCredential";
  case AuthState::AuthenticationPending:
    return "AuthenticationPending";
  case AuthState::Verifying:
    return "Verifying";
  case AuthState::Ready:
    return "Ready";
  case AuthState::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

Account::Account(std::size_t slot, std::unique_ptr<GitHubClient> client,
                 UserProfile profile)
    : slot_(slot), client_(std::move(client)), profile_(std::move(profile)) {}

AccountSetup::AccountSetup(CredentialStore &store, ClientFactory client_factory,
                           Authenticator authenticator)
    : store_(store), client_factory_(std::move(client_factory)),
      authenticator_(std::move(authenticator)) {}

void AccountSetup::enter(AuthState state) {
  transitions_.push_back(state);
  accounts_log()->debug("Account setup -> {}", to_string(state));
}

SetupResult AccountSetup::open(std::size_t slot) {
  transitions_.clear();
  std::optional<std::string> token = store_.load_token(slot);
  if (!token) {
    enter(AuthState::NoCredential);
  }
  int authorizations = 0;
  while (true) {
    if (!token) {
      if (authorizations >= kMaxAuthorizations) {
        accounts_log()->error("Slot {}: new access token was rejected", slot);
        return SetupFailed{"The new access token was rejected"};
      }
      ++authorizations;
      enter(AuthState::AuthenticationPending);
      AuthOutcome outcome = authenticator_();
      if (auto *cancelled = std::get_if<AuthCancelled>(&outcome)) {
        enter(AuthState::Cancelled);
        accounts_log()->info("Slot {}: setup cancelled ({})", slot,
                             cancelled->reason);
        return SetupCancelled{cancelled->reason};
      }
      if (auto *failed = std::get_if<AuthFailed>(&outcome)) {
        accounts_log()->error("Slot {}: authorization failed ({})", slot,
                              failed->reason);
        return SetupFailed{failed->reason};
      }
      token = std::get<AuthSuccess>(outcome).access_token;
      std::string error;
      if (!store_.save_token(slot, *token, &error)) {
        return SetupFailed{error};
      }
    }
    enter(AuthState::Verifying);
    std::unique_ptr<GitHubClient> client = client_factory_(*token);
    CredentialCheck check = client->check_credentials();
    if (check.status == CredentialStatus::Valid && check.profile) {
      enter(AuthState::Ready);
      accounts_log()->info("Slot {}: signed in as {}", slot,
                           check.profile->login);
      return std::make_shared<Account>(slot, std::move(client),
                                       std::move(*check.profile));
    }
    if (check.status == CredentialStatus::Rejected) {
      accounts_log()->warn("Slot {}: stored token rejected; signing in again",
                           slot);
      std::string error;
      if (!store_.clear_token(slot, &error)) {
        return SetupFailed{error};
      }
      token.reset();
      enter(AuthState::NoCredential);
      continue;
    }
    accounts_log()->error("Slot {}: verification failed ({})", slot,
                          check.message);
    return SetupFailed{check.message.empty() ? "Verification failed"
                                             : check.message};
  }
}

} // namespace fastgh
