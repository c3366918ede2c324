#include "session_registry.hpp"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>
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

} // namespace

SessionRegistry::SessionRegistry(CredentialStore &store,
                                 PreferenceStore &prefs, Opener opener)
    : store_(store), prefs_(prefs), opener_(std::move(opener)),
      owner_(std::this_thread::get_id()) {}

void SessionRegistry::bind_to_current_thread() {
  owner_ = std::this_thread::get_id();
}

void SessionRegistry::require_owner(const char *operation) const {
  if (std::this_thread::get_id() != owner_) {
    throw std::logic_error(std::string("SessionRegistry::") + operation +
                           " called off the owning thread");
  }
}

void SessionRegistry::persist_count() {
  // Slots that exist on disk but did not load still count.
  std::size_t count = std::max(accounts_.size(), store_.count_slots());
  prefs_.set(pref::kAccounts, static_cast<int>(count));
}

std::optional<std::size_t> SessionRegistry::current_slot() const {
  if (!current_) {
    return std::nullopt;
  }
  return current_->slot();
}

AddAccountResult SessionRegistry::open_slot(std::size_t slot) {
  AddAccountResult result;
  if (slot != accounts_.size()) {
    result.message = "Slot " + std::to_string(slot) +
                     " is not the next free slot (" +
                     std::to_string(accounts_.size()) + ")";
    accounts_log()->error("{}", result.message);
    return result;
  }
  SetupResult setup = opener_(slot);
  if (auto *account = std::get_if<std::shared_ptr<Account>>(&setup)) {
    accounts_.push_back(*account);
    if (!current_) {
      current_ = *account;
    }
    result.status = AddAccountStatus::Added;
    result.account = *account;
    accounts_log()->info("Added account {} in slot {}", (*account)->username(),
                         slot);
    return result;
  }
  if (auto *cancelled = std::get_if<SetupCancelled>(&setup)) {
    result.message = cancelled->reason;
    result.status = accounts_.empty() ? AddAccountStatus::ExitRequested
                                      : AddAccountStatus::Cancelled;
    return result;
  }
  result.message = std::get<SetupFailed>(setup).reason;
  return result;
}

AddAccountStatus SessionRegistry::load_all() {
  require_owner("load_all");
  Preferences prefs = Preferences::from(prefs_);
  AddAccountStatus status = AddAccountStatus::Added;
  for (int k = static_cast<int>(accounts_.size()); k < prefs.accounts; ++k) {
    AddAccountResult result = open_slot(static_cast<std::size_t>(k));
    if (result.status != AddAccountStatus::Added) {
      accounts_log()->warn("Stopped loading accounts at slot {}: {}", k,
                           result.message);
      status = result.status;
      break;
    }
  }
  if (accounts_.empty()) {
    return AddAccountStatus::ExitRequested;
  }
  return status;
}

AddAccountResult SessionRegistry::add_account(std::optional<std::size_t> slot) {
  require_owner("add_account");
  AddAccountResult result = open_slot(slot.value_or(accounts_.size()));
  if (result.status == AddAccountStatus::Added) {
    persist_count();
  }
  return result;
}

bool SessionRegistry::remove_account(std::size_t slot, std::string *error) {
  require_owner("remove_account");
  if (slot >= accounts_.size()) {
    std::string message = "No account in slot " + std::to_string(slot);
    accounts_log()->warn("{}", message);
    if (error != nullptr) {
      *error = message;
    }
    return false;
  }
  // A failed removal leaves the store as it was, so memory stays in step.
  if (!store_.remove_slot(slot, error)) {
    return false;
  }
  std::shared_ptr<Account> removed = accounts_[slot];
  accounts_.erase(accounts_.begin() + static_cast<std::ptrdiff_t>(slot));
  for (std::size_t k = slot; k < accounts_.size(); ++k) {
    accounts_[k]->set_slot(k);
  }
  persist_count();
  if (current_ == removed) {
    current_ = accounts_.empty() ? nullptr : accounts_.front();
  }
  accounts_log()->info("Removed account {} from slot {}", removed->username(),
                       slot);
  return true;
}

bool SessionRegistry::switch_account(std::size_t slot) {
  require_owner("switch_account");
  if (slot >= accounts_.size()) {
    return false;
  }
  current_ = accounts_[slot];
  accounts_log()->info("Switched to {}", current_->username());
  return true;
}

} // namespace fastgh
