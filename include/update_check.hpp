/**
 * @file update_check.hpp
 * @brief Compare the running version with the newest published release.
 */

#ifndef FASTGH_UPDATE_CHECK_HPP
#define FASTGH_UPDATE_CHECK_HPP

#include "github_client.hpp"
#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fastgh {

/** Result of check_for_update(). */
struct UpdateInfo {
  bool available = false;
  std::string current_version;
  std::string latest_version;
  std::string html_url; ///< Release page of the latest version
};

/// Numeric components of "v1.2.3" or "1.2.3"; `std::nullopt` when invalid.
std::optional<std::vector<int>> parse_version(const std::string &version);

/// Whether @p latest is strictly newer than @p current.
bool version_newer(const std::string &latest, const std::string &current);

/// Version announced in the release body ("**Version:** x.y.z"), otherwise
/// the tag name.
std::string release_version(const Release &release);

/**
 * Fetch the releases of @p repository ("owner/name") and compare the most
 * recent one with @p current_version.
 *
 * @return `std::nullopt` when no release could be fetched.
 */
std::optional<UpdateInfo> check_for_update(GitHubClient &client,
                                           const std::string &repository,
                                           const std::string &current_version);

} // namespace fastgh

#endif // FASTGH_UPDATE_CHECK_HPP
