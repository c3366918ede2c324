/**
 * @file credential_store.hpp
 * @brief Per-slot persisted access credentials.
 *
 * Slot `k` owns the directory `<root>/account<k>/` holding
 * `credentials.json`. Slot directories are kept contiguous: removing a slot
 * renames every higher slot down.
 */

#ifndef FASTGH_CREDENTIAL_STORE_HPP
#define FASTGH_CREDENTIAL_STORE_HPP

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace fastgh {

/** Filesystem-backed storage of one access token per account slot. */
class CredentialStore {
public:
  explicit CredentialStore(std::filesystem::path root);

  CredentialStore(const CredentialStore &) = delete;
  CredentialStore &operator=(const CredentialStore &) = delete;

  /// Directory containing every slot.
  const std::filesystem::path &root() const { return root_; }

  /// Directory of @p slot.
  std::filesystem::path slot_dir(std::size_t slot) const;

  /// Credential file of @p slot.
  std::filesystem::path credential_file(std::size_t slot) const;

  /// Stored token of @p slot, or `std::nullopt` when absent or unreadable.
  std::optional<std::string> load_token(std::size_t slot) const;

  /// Whether @p slot holds a non-empty token.
  bool has_token(std::size_t slot) const;

  /**
   * Persist @p token for @p slot with owner-only permissions.
   *
   * @param error Receives a description of a filesystem failure.
   */
  bool save_token(std::size_t slot, const std::string &token,
                  std::string *error = nullptr);

  /// Delete the credential file of @p slot, keeping its directory.
  bool clear_token(std::size_t slot, std::string *error = nullptr);

  /**
   * Remove @p slot and move every slot directory above it down.
   *
   * Later directories take the lowest free index in ascending order, so a
   * missing directory in the middle is closed too. The removed directory is
   * first renamed aside and deleted only after every move succeeded; on a
   * failed move the earlier moves are undone and the slot is restored.
   * Runs under an internal lock so concurrent removals are serialised.
   *
   * @param error Receives a description of a filesystem failure.
   */
  bool remove_slot(std::size_t slot, std::string *error = nullptr);

  /// Number of contiguous slot directories starting at slot 0.
  std::size_t count_slots() const;

private:
  std::filesystem::path root_;
  mutable std::mutex mutex_;
};

} // namespace fastgh

#endif // FASTGH_CREDENTIAL_STORE_HPP
