/**
 * @file session_registry.hpp
 * @brief Ordered set of ready accounts and the current account.
 */

#ifndef FASTGH_SESSION_REGISTRY_HPP
#define FASTGH_SESSION_REGISTRY_HPP

#include "account.hpp"
#include "credential_store.hpp"
#include "preferences.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fastgh {

/// Outcome category of SessionRegistry::add_account().
enum class AddAccountStatus {
  Added,         ///< Account ready and appended
  Cancelled,     ///< User cancelled; other accounts remain
  ExitRequested, ///< User cancelled with no account left; the app must exit
  Failed         ///< Terminal setup failure
};

/** Result of SessionRegistry::add_account(). */
struct AddAccountResult {
  AddAccountStatus status = AddAccountStatus::Failed;
  std::shared_ptr<Account> account; ///< Set when Added
  std::string message;
};

/**
 * Owner of every Account.
 *
 * Accounts are ordered by slot and slots stay contiguous (0..N-1). When the
 * registry is non-empty the current account is one of its members, otherwise
 * it is null. All mutations happen on the owning (UI) thread; calling a
 * mutator from another thread throws `std::logic_error`.
 */
class SessionRegistry {
public:
  /// Brings a slot to Ready (normally AccountSetup::open).
  using Opener = std::function<SetupResult(std::size_t slot)>;

  SessionRegistry(CredentialStore &store, PreferenceStore &prefs,
                  Opener opener);

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  /// Rebind ownership to the calling thread.
  void bind_to_current_thread();

  /**
   * Open every configured slot in order.
   *
   * Loading stops at the first slot that does not become ready.
   *
   * @return ExitRequested when no account could be opened, otherwise Added
   *         (or the status of the slot that stopped loading).
   */
  AddAccountStatus load_all();

  /**
   * Create an account for @p slot (default: the next free slot).
   *
   * On success the account is appended and, if no account is current, made
   * current. A cancellation while the registry is empty yields
   * ExitRequested and leaves the registry empty.
   */
  AddAccountResult add_account(std::optional<std::size_t> slot = std::nullopt);

  /**
   * Remove the account at @p slot together with its persisted credentials.
   *
   * Higher slots are renumbered down by one on disk and in memory and the
   * persisted account count is decremented. If the removed account was
   * current, the first remaining account (or null) becomes current.
   *
   * @param error Receives the reason of a failure.
   * @return `false` when @p slot is out of range or storage failed.
   */
  bool remove_account(std::size_t slot, std::string *error = nullptr);

  /// Make the account at @p slot current. Never re-authenticates.
  bool switch_account(std::size_t slot);

  std::shared_ptr<Account> current() const { return current_; }
  std::optional<std::size_t> current_slot() const;
  const std::vector<std::shared_ptr<Account>> &accounts() const {
    return accounts_;
  }
  std::size_t size() const { return accounts_.size(); }
  bool empty() const { return accounts_.empty(); }

private:
  AddAccountResult open_slot(std::size_t slot);
  void require_owner(const char *operation) const;
  void persist_count();

  CredentialStore &store_;
  PreferenceStore &prefs_;
  Opener opener_;
  std::vector<std::shared_ptr<Account>> accounts_;
  std::shared_ptr<Account> current_;
  std::thread::id owner_;
};

} // namespace fastgh

#endif // FASTGH_SESSION_REGISTRY_HPP
