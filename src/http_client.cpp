/**
 * @file http_client.cpp
 * @brief libcurl transport and retry decorator.
 */

#include "http_client.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

/**
 * Create a human readable error message for a CURL request.
 *
 * @param verb HTTP verb attempted.
 * @param url Request URL.
 * @param code CURL error code.
 * @param errbuf Optional buffer with extended error text.
 * @return Combined error description.
 */
std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_to_string(void *contents, size_t size, size_t nmemb,
                       void *userp) {
  size_t total = size * nmemb;
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            total);
  return total;
}

size_t write_to_stream(void *contents, size_t size, size_t nmemb,
                       void *userp) {
  size_t total = size * nmemb;
  auto *out = static_cast<std::ofstream *>(userp);
  out->write(static_cast<char *>(contents),
             static_cast<std::streamsize>(total));
  return out->good() ? total : 0;
}

size_t collect_header(char *buffer, size_t size, size_t nitems,
                      void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.pop_back();
  }
  if (!line.empty()) {
    static_cast<std::vector<std::string> *>(userdata)->push_back(line);
  }
  return total;
}

int report_progress(void *clientp, curl_off_t dltotal, curl_off_t dlnow,
                    curl_off_t, curl_off_t) {
  const auto *cb = static_cast<const ProgressCallback *>(clientp);
  if (cb != nullptr && *cb) {
    (*cb)(static_cast<std::uint64_t>(dlnow),
          static_cast<std::uint64_t>(dltotal));
  }
  return 0;
}

std::string lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

} // namespace

/**
 * Description of one request executed by CurlHttpClient::perform().
 */
struct CurlHttpClient::Request {
  const char *verb = "GET";
  const std::string *url = nullptr;
  const std::string *body = nullptr;
  const std::vector<std::string> *headers = nullptr;
  std::ofstream *sink = nullptr;
  const ProgressCallback *progress = nullptr;
};

HttpResponse HttpClient::download(const std::string &url,
                                  const std::vector<std::string> &headers,
                                  const std::string &dest_path,
                                  const ProgressCallback &progress) {
  HttpResponse res = get(url, headers);
  if (res.status_code < 200 || res.status_code >= 300) {
    return res;
  }
  std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Cannot open " + dest_path + " for writing");
  }
  out.write(res.body.data(), static_cast<std::streamsize>(res.body.size()));
  if (progress) {
    progress(res.body.size(), res.body.size());
  }
  res.body.clear();
  return res;
}

CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string user_agent,
                               std::string http_proxy, std::string https_proxy)
    : timeout_ms_(timeout_ms), user_agent_(std::move(user_agent)),
      http_proxy_(std::move(http_proxy)), https_proxy_(std::move(https_proxy)) {
  if (user_agent_.empty()) {
    user_agent_ = "fastgh";
  }
}

/**
 * Configure proxy settings on the CURL handle based on the request URL.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) const {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    proxy = !https_proxy_.empty()  ? &https_proxy_
            : !http_proxy_.empty() ? &http_proxy_
                                   : nullptr;
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0 && !http_proxy_.empty()) {
    proxy = &http_proxy_;
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

HttpResponse CurlHttpClient::perform(const Request &req) {
  CurlHandle handle;
  CURL *curl = handle.get();
  const std::string &url = *req.url;
  HttpResponse response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  if (req.sink != nullptr) {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, req.sink);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    // Transfers of release assets may take far longer than API calls.
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 0L);
  } else {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  }
  if (req.progress != nullptr && *req.progress) {
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, report_progress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, req.progress);
  }
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, collect_header);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

  const std::string verb = req.verb;
  if (verb == "POST") {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
  } else if (verb != "GET") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.verb);
  }
  if (req.body != nullptr) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(req.body->size()));
  }

  CurlSlist header_list;
  for (const auto &h : *req.headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: " + user_agent_);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  curl_off_t dl = 0;
  curl_off_t ul = 0;
  curl_easy_getinfo(curl, CURLINFO_SIZE_DOWNLOAD_T, &dl);
  curl_easy_getinfo(curl, CURLINFO_SIZE_UPLOAD_T, &ul);
  total_downloaded_ += static_cast<std::uint64_t>(dl);
  total_uploaded_ += static_cast<std::uint64_t>(ul);

  if (res != CURLE_OK) {
    std::string msg = format_curl_error(req.verb, url, res, errbuf);
    http_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  if (response.status_code >= 500) {
    http_log()->warn("{} {} returned HTTP {}", req.verb, url,
                     response.status_code);
    throw HttpStatusError(static_cast<int>(response.status_code),
                          std::string("curl ") + req.verb +
                              " failed with HTTP code " +
                              std::to_string(response.status_code));
  }
  http_log()->debug("{} {} -> {}", req.verb, url, response.status_code);
  return response;
}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers) {
  Request req;
  req.url = &url;
  req.headers = &headers;
  return perform(req);
}

HttpResponse CurlHttpClient::post(const std::string &url,
                                  const std::string &data,
                                  const std::vector<std::string> &headers) {
  Request req;
  req.verb = "POST";
  req.url = &url;
  req.body = &data;
  req.headers = &headers;
  return perform(req);
}

HttpResponse CurlHttpClient::put(const std::string &url,
                                 const std::string &data,
                                 const std::vector<std::string> &headers) {
  Request req;
  req.verb = "PUT";
  req.url = &url;
  req.body = &data;
  req.headers = &headers;
  return perform(req);
}

HttpResponse CurlHttpClient::patch(const std::string &url,
                                   const std::string &data,
                                   const std::vector<std::string> &headers) {
  Request req;
  req.verb = "PATCH";
  req.url = &url;
  req.body = &data;
  req.headers = &headers;
  return perform(req);
}

HttpResponse CurlHttpClient::del(const std::string &url,
                                 const std::vector<std::string> &headers) {
  Request req;
  req.verb = "DELETE";
  req.url = &url;
  req.headers = &headers;
  return perform(req);
}

HttpResponse CurlHttpClient::download(const std::string &url,
                                      const std::vector<std::string> &headers,
                                      const std::string &dest_path,
                                      const ProgressCallback &progress) {
  std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Cannot open " + dest_path + " for writing");
  }
  Request req;
  req.url = &url;
  req.headers = &headers;
  req.sink = &out;
  req.progress = &progress;
  return perform(req);
}

RetryHttpClient::RetryHttpClient(std::unique_ptr<HttpClient> inner,
                                 int max_retries, int backoff_ms)
    : inner_(std::move(inner)), max_retries_(max_retries),
      backoff_ms_(backoff_ms) {}

template <typename F> HttpResponse RetryHttpClient::request(F f) {
  int attempt = 0;
  while (true) {
    try {
      return f();
    } catch (const std::exception &e) {
      if (attempt >= max_retries_ || !is_transient_error(e)) {
        throw;
      }
      http_log()->warn("Retrying after transient failure ({}/{}): {}",
                       attempt + 1, max_retries_, e.what());
      std::this_thread::sleep_for(
          std::chrono::milliseconds(backoff_ms_ * (1 << attempt)));
      ++attempt;
    }
  }
}

HttpResponse RetryHttpClient::get(const std::string &url,
                                  const std::vector<std::string> &headers) {
  return request([&] { return inner_->get(url, headers); });
}

HttpResponse RetryHttpClient::post(const std::string &url,
                                   const std::string &data,
                                   const std::vector<std::string> &headers) {
  return request([&] { return inner_->post(url, data, headers); });
}

HttpResponse RetryHttpClient::put(const std::string &url,
                                  const std::string &data,
                                  const std::vector<std::string> &headers) {
  return request([&] { return inner_->put(url, data, headers); });
}

HttpResponse RetryHttpClient::patch(const std::string &url,
                                    const std::string &data,
                                    const std::vector<std::string> &headers) {
  return request([&] { return inner_->patch(url, data, headers); });
}

HttpResponse RetryHttpClient::del(const std::string &url,
                                  const std::vector<std::string> &headers) {
  return request([&] { return inner_->del(url, headers); });
}

HttpResponse RetryHttpClient::download(const std::string &url,
                                       const std::vector<std::string> &headers,
                                       const std::string &dest_path,
                                       const ProgressCallback &progress) {
  return request(
      [&] { return inner_->download(url, headers, dest_path, progress); });
}

bool is_transient_error(const std::exception &e) {
  if (dynamic_cast<const TransientNetworkError *>(&e)) {
    return true;
  }
  if (auto http_err = dynamic_cast<const HttpStatusError *>(&e)) {
    return http_err->status >= 500 && http_err->status < 600;
  }
  return false;
}

std::string url_encode(const std::string &value) {
  if (value.empty()) {
    return value;
  }
  CurlHandle curl;
  char *escaped = curl_easy_escape(curl.get(), value.c_str(),
                                   static_cast<int>(value.size()));
  if (escaped == nullptr) {
    throw std::runtime_error("Failed to percent-encode '" + value + "'");
  }
  std::string encoded(escaped);
  curl_free(escaped);
  return encoded;
}

std::optional<std::string>
find_header(const std::vector<std::string> &headers, const std::string &name) {
  const std::string wanted = lower_copy(name);
  for (const auto &line : headers) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    if (lower_copy(line.substr(0, colon)) != wanted) {
      continue;
    }
    std::string value = line.substr(colon + 1);
    auto first = value.find_first_not_of(" \t");
    auto last = value.find_last_not_of(" \t");
    if (first == std::string::npos) {
      return std::string{};
    }
    return value.substr(first, last - first + 1);
  }
  return std::nullopt;
}

} // namespace fastgh
