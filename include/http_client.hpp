/**
 * @file http_client.hpp
 * @brief HTTP transport abstractions used by the GitHub API client.
 *
 * Declares the transport error types, the ::HttpClient interface, the libcurl
 * implementation and a retrying decorator.
 */

#ifndef FASTGH_HTTP_CLIENT_HPP
#define FASTGH_HTTP_CLIENT_HPP

#include <atomic>
#include <cstdint>
#include <curl/curl.h>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fastgh {

/** Raised when a request fails before an HTTP status was received. */
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/** Raised for server side (5xx) HTTP failures. */
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status_code, const std::string &message)
      : std::runtime_error(message), status(status_code) {}

  int status; ///< HTTP status code returned by the server
};

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/// Progress callback receiving downloaded and total byte counts.
using ProgressCallback =
    std::function<void(std::uint64_t downloaded, std::uint64_t total)>;

/**
 * Interface for performing HTTP requests.
 *
 * Implementations throw ::TransientNetworkError for transport failures and
 * ::HttpStatusError for 5xx responses. Every other status is returned in the
 * ::HttpResponse so callers can interpret it.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   */
  virtual HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers) = 0;

  /// Perform a HTTP POST request with @p data as body.
  virtual HttpResponse post(const std::string &url, const std::string &data,
                            const std::vector<std::string> &headers) = 0;

  /// Perform a HTTP PUT request with @p data as body.
  virtual HttpResponse put(const std::string &url, const std::string &data,
                           const std::vector<std::string> &headers) = 0;

  /// Perform a HTTP PATCH request with @p data as body.
  virtual HttpResponse patch(const std::string &url, const std::string &data,
                             const std::vector<std::string> &headers) = 0;

  /// Perform a HTTP DELETE request.
  virtual HttpResponse del(const std::string &url,
                           const std::vector<std::string> &headers) = 0;

  /**
   * Download a resource into a file, following redirects.
   *
   * The base implementation buffers the body returned by get() and writes it
   * to @p dest_path in one go.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers.
   * @param dest_path Destination file, truncated when it exists.
   * @param progress Optional progress callback.
   * @return Final response with an empty body.
   */
  virtual HttpResponse download(const std::string &url,
                                const std::vector<std::string> &headers,
                                const std::string &dest_path,
                                const ProgressCallback &progress);
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;
  /// Borrowed pointer to the managed easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * Every request runs on its own easy handle so one instance may be shared by
 * concurrent worker threads.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param timeout_ms Request timeout in milliseconds.
   * @param user_agent Value of the User-Agent header.
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   */
  explicit CurlHttpClient(long timeout_ms = 30000, std::string user_agent = {},
                          std::string http_proxy = {},
                          std::string https_proxy = {});

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override;
  HttpResponse post(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override;
  HttpResponse put(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override;
  HttpResponse patch(const std::string &url, const std::string &data,
                     const std::vector<std::string> &headers) override;
  HttpResponse del(const std::string &url,
                   const std::vector<std::string> &headers) override;
  HttpResponse download(const std::string &url,
                        const std::vector<std::string> &headers,
                        const std::string &dest_path,
                        const ProgressCallback &progress) override;

  /// Total bytes downloaded so far.
  std::uint64_t total_downloaded() const { return total_downloaded_; }

  /// Total bytes uploaded so far.
  std::uint64_t total_uploaded() const { return total_uploaded_; }

private:
  struct Request;

  HttpResponse perform(const Request &req);
  void apply_proxy(CURL *curl, const std::string &url) const;

  long timeout_ms_;
  std::string user_agent_;
  std::string http_proxy_;
  std::string https_proxy_;
  std::atomic<std::uint64_t> total_downloaded_{0};
  std::atomic<std::uint64_t> total_uploaded_{0};
};

/**
 * HTTP client decorator that retries transient failures with exponential
 * backoff (`backoff_ms * 2^attempt`).
 */
class RetryHttpClient : public HttpClient {
public:
  /**
   * @param inner Underlying client performing real requests.
   * @param max_retries Maximum retries for transient failures.
   * @param backoff_ms Base delay in milliseconds.
   */
  RetryHttpClient(std::unique_ptr<HttpClient> inner, int max_retries,
                  int backoff_ms);

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override;
  HttpResponse post(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override;
  HttpResponse put(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override;
  HttpResponse patch(const std::string &url, const std::string &data,
                     const std::vector<std::string> &headers) override;
  HttpResponse del(const std::string &url,
                   const std::vector<std::string> &headers) override;
  HttpResponse download(const std::string &url,
                        const std::vector<std::string> &headers,
                        const std::string &dest_path,
                        const ProgressCallback &progress) override;

private:
  template <typename F> HttpResponse request(F f);

  std::unique_ptr<HttpClient> inner_;
  int max_retries_;
  int backoff_ms_;
};

/**
 * Determine whether an exception represents a retryable failure.
 *
 * @return `true` for ::TransientNetworkError and 5xx ::HttpStatusError.
 */
bool is_transient_error(const std::exception &e);

/// Percent-encode a string for use in a URL path segment or query value.
std::string url_encode(const std::string &value);

/**
 * Find a response header value by case-insensitive name.
 *
 * @param headers Raw header lines as collected from the response.
 * @param name Header name without the colon.
 * @return Trimmed value of the first matching header.
 */
std::optional<std::string>
find_header(const std::vector<std::string> &headers, const std::string &name);

} // namespace fastgh

#endif // FASTGH_HTTP_CLIENT_HPP
