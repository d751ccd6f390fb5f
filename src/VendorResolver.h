#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

#include "HttpClient.h"
#include "OuiDatabase.h"

// Resolves a hardware address to a manufacturer name.
//
// Chain: proxy identifier / randomized address -> none; process cache
// (negative results included); local OUI database; remote API. The remote
// call carries only the three-octet prefix, is serialized behind one shared
// cooldown and never retried within a process.
class VendorResolver {
public:
  struct Options {
    std::string api_url = "https://api.macvendors.com/";
    long        cooldown_ms = 1000;
    long        timeout_ms = 5000;
  };

  // `local_db` may be null (remote-only resolution).
  VendorResolver(HttpClient& http, OuiDatabase* local_db, Options options);

  // Vendor name, or an empty string when there is none. Never throws.
  std::string resolve(const std::string& address);

  size_t remoteLookups() const { return _remoteLookups.load(); }
  size_t cacheSize() const;

private:
  bool cached(const std::string& key, std::string& vendor) const;
  void store(const std::string& key, const std::string& vendor);
  std::string lookupRemote(const std::string& key);

  HttpClient& _http;
  OuiDatabase* _localDb;
  Options _options;

  mutable std::mutex _cacheMutex;
  std::unordered_map<std::string, std::string> _cache;  // "" = no vendor

  // Held for the whole cooldown + request: the single remote serialization point.
  std::mutex _remoteMutex;
  bool _haveRemoteCall = false;
  std::chrono::steady_clock::time_point _lastRemoteCall{};

  std::atomic<size_t> _remoteLookups{0};
};
