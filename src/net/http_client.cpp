#include "ticketsim/net/http_client.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace ticketsim::net {

namespace {

constexpr const char* kComponent = "net.http";

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

struct easy_deleter {
  void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
struct slist_deleter {
  void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

void ensure_global_init() {
  static std::once_flag once;
  std::call_once(once, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

} // namespace

auto post_json(const std::string& url, const std::string& body, const post_options& options)
    -> std::expected<http_response, core::error> {
  ensure_global_init();

  std::unique_ptr<CURL, easy_deleter> curl(curl_easy_init());
  if (!curl) {
    return core::make_error(core::error_code::provider_failed, "Failed to initialize cURL",
                            kComponent);
  }

  std::unique_ptr<curl_slist, slist_deleter> headers;
  auto append_header = [&headers](const std::string& line) -> bool {
    curl_slist* next = curl_slist_append(headers.get(), line.c_str());
    if (!next) return false;
    (void)headers.release();
    headers.reset(next);
    return true;
  };
  std::vector<std::string> lines{"Content-Type: application/json", "Accept: application/json"};
  lines.insert(lines.end(), options.headers.begin(), options.headers.end());
  for (const auto& line : lines) {
    if (!append_header(line)) {
      return core::make_error(core::error_code::provider_failed,
                              "Failed to build request headers", kComponent);
    }
  }

  http_response resp;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    spdlog::debug("[{}] POST {} failed: {}", kComponent, url, curl_easy_strerror(rc));
    return core::make_error(core::error_code::provider_failed,
                            std::string("HTTP request failed: ") + curl_easy_strerror(rc),
                            kComponent);
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
  spdlog::debug("[{}] POST {} -> {} ({} bytes)", kComponent, url, resp.status, resp.body.size());
  return resp;
}

} // namespace ticketsim::net
