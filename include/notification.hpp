#ifndef FASTGH_NOTIFICATION_HPP
#define FASTGH_NOTIFICATION_HPP

#include <cstdlib>
#include <functional>
#include <memory>
#include <string>

namespace fastgh {

/**
 * Interface for showing transient desktop notifications.
 *
 * Delivery is fire-and-forget: no acknowledgement or click-through is
 * reported back to the caller.
 */
class Notifier {
public:
  virtual ~Notifier() = default;
  /**
   * Show a notification.
   *
   * @param title Short heading, for example "3 new GitHub notifications".
   * @param body Detail line naming a representative item.
   */
  virtual void notify(const std::string &title, const std::string &body) = 0;
};

/**
 * Desktop notifier that invokes platform-specific utilities:
 *
 * - Linux: `notify-send`
 * - Windows: BurntToast PowerShell module
 * - macOS: `terminal-notifier` (preferred) or `osascript`
 *
 * If the required tool is not available, the notification request is ignored.
 */
class NotifySendNotifier : public Notifier {
public:
  using CommandRunner = std::function<int(const std::string &)>;

  /**
   * Construct a notifier that executes platform-specific commands.
   *
   * @param runner Callback responsible for executing shell commands. The
   *        default implementation delegates to `std::system`.
   * @param app_name Application name shown by the notification daemon.
   */
  explicit NotifySendNotifier(CommandRunner runner =
                                  [](const std::string &cmd) {
                                    return std::system(cmd.c_str());
                                  },
                              std::string app_name = "fastgh");

  void notify(const std::string &title, const std::string &body) override;

private:
  CommandRunner run_;
  std::string app_name_;
};

/// Notifier that only writes the message to the log.
class LogNotifier : public Notifier {
public:
  void notify(const std::string &title, const std::string &body) override;
};

using NotifierPtr = std::shared_ptr<Notifier>;

} // namespace fastgh

#endif // FASTGH_NOTIFICATION_HPP
