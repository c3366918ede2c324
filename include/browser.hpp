/**
 * @file browser.hpp
 * @brief Helpers for opening URLs and filling the system clipboard.
 */

#ifndef FASTGH_BROWSER_HPP
#define FASTGH_BROWSER_HPP

#include <string>

namespace fastgh {

/**
 * @brief Open @p url in the default browser.
 * @return True on success or when skipped via FASTGH_TEST_SKIP_BROWSER, false
 * otherwise.
 */
bool open_url(const std::string &url);

/**
 * @brief Copy @p text to the system clipboard.
 *
 * Uses pbcopy, clip, wl-copy, xclip or xsel depending on the platform.
 *
 * @return True when a clipboard tool accepted the text or when skipped via
 * FASTGH_TEST_SKIP_BROWSER.
 */
bool copy_to_clipboard(const std::string &text);

} // namespace fastgh

#endif // FASTGH_BROWSER_HPP
