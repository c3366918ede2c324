/**
 * @file token_loader.hpp
 * @brief Access token import for seeding account slots.
 */
#ifndef FASTGH_TOKEN_LOADER_HPP
#define FASTGH_TOKEN_LOADER_HPP

#include <string>
#include <vector>

namespace fastgh {

/**
 * Load GitHub access tokens from a file.
 *
 * JSON, YAML and TOML files may contain a flat array of tokens or an object
 * with a single `token` string and/or a `tokens` array. Any other extension is
 * read as a plain list with one token per line; blank lines and lines starting
 * with `#` are skipped. Duplicates are dropped while preserving order.
 *
 * @param path Filesystem path to the token file
 * @return Vector of tokens discovered in the file
 * @throws std::runtime_error on parse or read errors
 */
std::vector<std::string> load_tokens_from_file(const std::string &path);

} // namespace fastgh

#endif // FASTGH_TOKEN_LOADER_HPP
