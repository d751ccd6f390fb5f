#include "HttpClient.h"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

static constexpr const char* USER_AGENT = "bluehood/1.0";

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

CurlGlobal::CurlGlobal() {
  _ok = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

CurlGlobal::~CurlGlobal() {
  if (_ok) curl_global_cleanup();
}

bool CurlHttpClient::get(const std::string& url, long timeout_ms, HttpResponse& out) {
  return perform(url, nullptr, nullptr, timeout_ms, out);
}

bool CurlHttpClient::post(const std::string& url,
                          const HttpHeaders& headers,
                          const std::string& body,
                          long timeout_ms,
                          HttpResponse& out) {
  return perform(url, &headers, &body, timeout_ms, out);
}

bool CurlHttpClient::perform(const std::string& url,
                             const HttpHeaders* headers,
                             const std::string* body,
                             long timeout_ms,
                             HttpResponse& out) {
  out = HttpResponse{};

  CURL* curl = curl_easy_init();
  if (!curl) {
    spdlog::warn("curl_easy_init failed");
    return false;
  }

  struct curl_slist* hdrs = nullptr;
  if (headers) {
    for (const auto& h : *headers) {
      const std::string line = h.first + ": " + h.second;
      hdrs = curl_slist_append(hdrs, line.c_str());
    }
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
  if (hdrs) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
  if (body) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  const CURLcode rc = curl_easy_perform(curl);
  if (rc == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
  } else {
    spdlog::debug("HTTP {} failed: {}", url, curl_easy_strerror(rc));
  }

  if (hdrs) curl_slist_free_all(hdrs);
  curl_easy_cleanup(curl);
  return rc == CURLE_OK;
}
