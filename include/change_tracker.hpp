/**
 * @file change_tracker.hpp
 * @brief Detects new or updated items between refreshes and raises one
 * desktop notification per detected batch.
 *
 * Each stream keeps a snapshot of the keys seen on its previous refresh. The
 * snapshot starts uninitialized so the first refresh after launch never
 * notifies, and it is replaced after every refresh whether or not a
 * notification fired (including when the stream's toggle is off).
 */

#ifndef FASTGH_CHANGE_TRACKER_HPP
#define FASTGH_CHANGE_TRACKER_HPP

#include "models.hpp"
#include "notification.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fastgh {

/// Streams eligible for change notifications.
enum class ChangeStream { Feed, Notifications, Starred, Watched };

/** Summary of the changes detected by one refresh. */
struct ChangeAlert {
  ChangeStream stream = ChangeStream::Feed;
  std::string title; ///< "3 new GitHub notifications"
  std::string body;  ///< Representative item
  std::size_t count = 0;
  std::vector<std::string> ids; ///< Identifiers of the changed items
};

/**
 * Per-stream change detector.
 *
 * Feed and notification streams compare item identifiers (notifications
 * restricted to unread threads). Starred and watched streams pair the
 * repository id with its last push time and report repositories whose id
 * was already known but whose push time changed; newly listed repositories
 * are not reported.
 *
 * Each stream is serialised by its own mutex, covering the comparison, the
 * notification and the snapshot replacement. Streams are independent.
 */
class ChangeTracker {
public:
  explicit ChangeTracker(NotifierPtr notifier = nullptr);

  ChangeTracker(const ChangeTracker &) = delete;
  ChangeTracker &operator=(const ChangeTracker &) = delete;

  /**
   * Compare a feed refresh with the previous one.
   *
   * @param enabled Whether the user enabled notifications for this stream.
   * @return The detected changes when a notification was raised.
   */
  std::optional<ChangeAlert> observe_feed(const std::vector<Event> &events,
                                          bool enabled);
  std::optional<ChangeAlert>
  observe_notifications(const std::vector<Notification> &notifications,
                        bool enabled);
  std::optional<ChangeAlert>
  observe_starred(const std::vector<Repository> &repos, bool enabled);
  std::optional<ChangeAlert>
  observe_watched(const std::vector<Repository> &repos, bool enabled);

  /// Whether @p stream has completed its first refresh.
  bool initialized(ChangeStream stream) const;

  /// Identifier to comparison value map of @p stream's snapshot.
  std::optional<std::map<std::string, std::string>>
  snapshot(ChangeStream stream) const;

private:
  /// Identifier mapped to its paired timestamp (empty for id-only streams).
  using Keys = std::map<std::string, std::string>;

  struct Slot {
    mutable std::mutex mutex;
    std::optional<Keys> keys;
  };

  std::optional<ChangeAlert> observe_repos(ChangeStream stream,
                                           const std::vector<Repository> &repos,
                                           bool enabled);
  void raise(const ChangeAlert &alert);
  Slot &slot(ChangeStream stream);
  const Slot &slot(ChangeStream stream) const;

  NotifierPtr notifier_;
  std::array<Slot, 4> slots_;
};

/// Printable name of @p stream.
const char *to_string(ChangeStream stream);

} // namespace fastgh

#endif // FASTGH_CHANGE_TRACKER_HPP
