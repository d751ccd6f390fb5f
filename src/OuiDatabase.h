#pragma once

#include <atomic>
#include <cstddef>
#include <istream>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "HttpClient.h"

// Offline manufacturer table keyed by 24-bit prefix ("AABBCC" -> vendor).
//
// The table is read from a local cache file. The first lookup in a process
// starts one background refresh that downloads the IEEE registry, rewrites
// the cache file and swaps the new table in. Lookups never wait for it and a
// failed refresh is not retried until the next process start.
class OuiDatabase {
public:
  OuiDatabase(HttpClient& http,
              std::string cache_path,
              std::string registry_url,
              long download_timeout_ms);
  ~OuiDatabase();

  OuiDatabase(const OuiDatabase&) = delete;
  OuiDatabase& operator=(const OuiDatabase&) = delete;

  // Reads the cache file. False when it is missing or empty.
  bool load();

  // Prefix lookup for a colon-separated address.
  bool lookup(const std::string& mac, std::string& vendor);

  // Downloads and installs the registry synchronously.
  bool refresh();

  // Blocks until a background refresh (if any) has finished.
  void waitForRefresh();

  size_t size() const;
  bool refreshAttempted() const { return _refreshStarted.load(); }

  // "28-6F-B9  (hex)  Vendor" / "286FB9  (base 16)  Vendor" registry text.
  static size_t ParseRegistry(const std::string& text,
                              std::unordered_map<std::string, std::string>& out);

  // "286FB9:Vendor" cache lines.
  static size_t ParseCache(std::istream& in,
                           std::unordered_map<std::string, std::string>& out);

  // Trims whitespace and replaces every byte that is not part of a valid
  // UTF-8 sequence with '?'.
  static std::string CleanVendorName(const std::string& raw);

private:
  void startRefreshOnce();
  bool writeCache(const std::unordered_map<std::string, std::string>& table) const;

  HttpClient& _http;
  std::string _cachePath;
  std::string _registryUrl;
  long _downloadTimeoutMs;

  mutable std::mutex _mutex;
  std::unordered_map<std::string, std::string> _table;

  std::atomic<bool> _refreshStarted{false};
  std::thread _refreshThread;
};
