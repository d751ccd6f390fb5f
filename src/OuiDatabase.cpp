#include "OuiDatabase.h"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "MacAddress.h"

static std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace((unsigned char)s[b])) b++;
  while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
  return s.substr(b, e - b);
}

// Length of the valid UTF-8 sequence starting at s[i], 0 if there is none.
static size_t utf8_sequence_length(const std::string& s, size_t i) {
  const unsigned char c = (unsigned char)s[i];
  size_t len;
  unsigned char lo = 0x80, hi = 0xBF;  // bounds for the second byte
  if (c < 0x80) return 1;
  else if (c >= 0xC2 && c <= 0xDF) len = 2;
  else if (c == 0xE0) { len = 3; lo = 0xA0; }
  else if (c == 0xED) { len = 3; hi = 0x9F; }
  else if (c >= 0xE1 && c <= 0xEF) len = 3;
  else if (c == 0xF0) { len = 4; lo = 0x90; }
  else if (c == 0xF4) { len = 4; hi = 0x8F; }
  else if (c >= 0xF1 && c <= 0xF3) len = 4;
  else return 0;

  if (i + len > s.size()) return 0;
  const unsigned char c1 = (unsigned char)s[i + 1];
  if (c1 < lo || c1 > hi) return 0;
  for (size_t k = 2; k < len; k++) {
    const unsigned char ck = (unsigned char)s[i + k];
    if (ck < 0x80 || ck > 0xBF) return 0;
  }
  return len;
}

static bool is_hex6(const std::string& s) {
  if (s.size() != 6) return false;
  for (char c : s) {
    if (!std::isxdigit((unsigned char)c)) return false;
  }
  return true;
}

// "AA:BB:CC" -> "AABBCC"
static std::string prefix_key(const std::string& oui) {
  std::string key;
  key.reserve(6);
  for (char c : oui) {
    if (c != ':') key.push_back((char)std::toupper((unsigned char)c));
  }
  return key;
}

OuiDatabase::OuiDatabase(HttpClient& http,
                         std::string cache_path,
                         std::string registry_url,
                         long download_timeout_ms)
  : _http(http),
    _cachePath(std::move(cache_path)),
    _registryUrl(std::move(registry_url)),
    _downloadTimeoutMs(download_timeout_ms) {}

OuiDatabase::~OuiDatabase() {
  waitForRefresh();
}

size_t OuiDatabase::ParseRegistry(const std::string& text,
                                  std::unordered_map<std::string, std::string>& out) {
  size_t n = 0;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    const size_t tag = line.find("(base 16)");
    if (tag == std::string::npos) continue;

    const std::string key = trim(line.substr(0, tag));
    const std::string vendor = CleanVendorName(line.substr(tag + 9));
    if (!is_hex6(key) || vendor.empty()) continue;

    std::string upper = key;
    for (char& c : upper) c = (char)std::toupper((unsigned char)c);
    out[upper] = vendor;
    n++;
  }
  return n;
}

size_t OuiDatabase::ParseCache(std::istream& in,
                               std::unordered_map<std::string, std::string>& out) {
  size_t n = 0;
  std::string line;
  while (std::getline(in, line)) {
    const size_t colon = line.find(':');
    if (colon == std::string::npos) continue;

    std::string key = line.substr(0, colon);
    const std::string vendor = CleanVendorName(line.substr(colon + 1));
    if (!is_hex6(key) || vendor.empty()) continue;

    for (char& c : key) c = (char)std::toupper((unsigned char)c);
    out[key] = vendor;
    n++;
  }
  return n;
}

std::string OuiDatabase::CleanVendorName(const std::string& raw) {
  const std::string text = trim(raw);
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size();) {
    const size_t len = utf8_sequence_length(text, i);
    if (len == 0) {
      out.push_back('?');
      i++;
    } else {
      out.append(text, i, len);
      i += len;
    }
  }
  return out;
}

bool OuiDatabase::load() {
  std::ifstream in(_cachePath);
  if (!in.is_open()) {
    spdlog::debug("No vendor cache at {}", _cachePath);
    return false;
  }

  std::unordered_map<std::string, std::string> table;
  const size_t n = ParseCache(in, table);

  std::lock_guard<std::mutex> lock(_mutex);
  _table.swap(table);
  spdlog::info("Loaded {} vendor prefixes from {}", n, _cachePath);
  return n > 0;
}

bool OuiDatabase::lookup(const std::string& mac, std::string& vendor) {
  startRefreshOnce();

  const std::string oui = MacAddress::OuiPrefix(mac);
  if (oui.empty()) return false;

  std::lock_guard<std::mutex> lock(_mutex);
  auto it = _table.find(prefix_key(oui));
  if (it == _table.end()) return false;
  vendor = it->second;
  return true;
}

size_t OuiDatabase::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _table.size();
}

void OuiDatabase::startRefreshOnce() {
  bool expected = false;
  if (!_refreshStarted.compare_exchange_strong(expected, true)) return;

  _refreshThread = std::thread([this] {
    if (!refresh()) {
      spdlog::warn("Could not update vendor database; using {} cached prefixes", size());
    }
  });
}

void OuiDatabase::waitForRefresh() {
  if (_refreshThread.joinable()) _refreshThread.join();
}

bool OuiDatabase::refresh() {
  spdlog::info("Updating MAC vendor database from {}", _registryUrl);

  HttpResponse resp;
  if (!_http.get(_registryUrl, _downloadTimeoutMs, resp)) return false;
  if (resp.status != 200) {
    spdlog::debug("Vendor registry download returned HTTP {}", resp.status);
    return false;
  }

  std::unordered_map<std::string, std::string> table;
  const size_t n = ParseRegistry(resp.body, table);
  if (n == 0) {
    spdlog::debug("Vendor registry download contained no prefixes");
    return false;
  }

  if (!writeCache(table)) {
    spdlog::warn("Could not write vendor cache {}", _cachePath);
  }

  {
    std::lock_guard<std::mutex> lock(_mutex);
    _table.swap(table);
  }
  spdlog::info("MAC vendor database updated ({} prefixes)", n);
  return true;
}

bool OuiDatabase::writeCache(const std::unordered_map<std::string, std::string>& table) const {
  if (_cachePath.empty()) return false;

  const std::string tmp = _cachePath + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) return false;
    for (const auto& kv : table) out << kv.first << ':' << kv.second << '\n';
    if (!out.good()) return false;
  }
  return std::rename(tmp.c_str(), _cachePath.c_str()) == 0;
}
