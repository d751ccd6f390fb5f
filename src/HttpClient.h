#pragma once

#include <string>
#include <utility>
#include <vector>

struct HttpResponse {
  long        status = 0;
  std::string body;
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Minimal blocking HTTP client. Both calls return false on transport failure
// (DNS, connect, TLS, timeout); any HTTP status counts as a completed request.
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual bool get(const std::string& url, long timeout_ms, HttpResponse& out) = 0;

  virtual bool post(const std::string& url,
                    const HttpHeaders& headers,
                    const std::string& body,
                    long timeout_ms,
                    HttpResponse& out) = 0;
};

// libcurl-backed client. One easy handle per request so calls from different
// threads never share curl state. Requires CurlGlobal to be alive.
class CurlHttpClient : public HttpClient {
public:
  bool get(const std::string& url, long timeout_ms, HttpResponse& out) override;

  bool post(const std::string& url,
            const HttpHeaders& headers,
            const std::string& body,
            long timeout_ms,
            HttpResponse& out) override;

private:
  bool perform(const std::string& url,
               const HttpHeaders* headers,
               const std::string* body,
               long timeout_ms,
               HttpResponse& out);
};

// curl_global_init / curl_global_cleanup for the lifetime of main().
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;

  bool ok() const { return _ok; }

private:
  bool _ok = false;
};
