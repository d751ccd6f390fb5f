#include "VendorResolver.h"

#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "MacAddress.h"

static constexpr long HTTP_OK = 200;
static constexpr long HTTP_NOT_FOUND = 404;
static constexpr long HTTP_TOO_MANY_REQUESTS = 429;

VendorResolver::VendorResolver(HttpClient& http, OuiDatabase* local_db, Options options)
  : _http(http), _localDb(local_db), _options(std::move(options)) {}

size_t VendorResolver::cacheSize() const {
  std::lock_guard<std::mutex> lock(_cacheMutex);
  return _cache.size();
}

bool VendorResolver::cached(const std::string& key, std::string& vendor) const {
  std::lock_guard<std::mutex> lock(_cacheMutex);
  auto it = _cache.find(key);
  if (it == _cache.end()) return false;
  vendor = it->second;
  return true;
}

void VendorResolver::store(const std::string& key, const std::string& vendor) {
  std::lock_guard<std::mutex> lock(_cacheMutex);
  _cache[key] = vendor;
}

std::string VendorResolver::resolve(const std::string& address) {
  // No manufacturer prefix to look at
  if (MacAddress::IsProxyIdentifier(address)) return {};
  if (MacAddress::IsLocallyAdministered(address)) return {};

  const std::string key = MacAddress::Normalize(address);

  std::string vendor;
  if (cached(key, vendor)) return vendor;

  if (_localDb && _localDb->lookup(key, vendor)) {
    store(key, vendor);
    return vendor;
  }

  vendor = lookupRemote(key);
  store(key, vendor);
  return vendor;
}

std::string VendorResolver::lookupRemote(const std::string& key) {
  const std::string oui = MacAddress::OuiPrefix(key);
  if (oui.empty()) return {};

  std::lock_guard<std::mutex> lock(_remoteMutex);

  // Another scan path may have resolved this address while we queued.
  std::string vendor;
  if (cached(key, vendor)) return vendor;

  if (_haveRemoteCall) {
    const auto next = _lastRemoteCall + std::chrono::milliseconds(_options.cooldown_ms);
    std::this_thread::sleep_until(next);
  }

  _remoteLookups++;
  HttpResponse resp;
  const bool ok = _http.get(_options.api_url + oui, _options.timeout_ms, resp);
  _lastRemoteCall = std::chrono::steady_clock::now();
  _haveRemoteCall = true;

  if (!ok) {
    spdlog::debug("Vendor API error for {}", oui);
    return {};
  }

  switch (resp.status) {
    case HTTP_OK:
      return OuiDatabase::CleanVendorName(resp.body);
    case HTTP_NOT_FOUND:
      return {};
    case HTTP_TOO_MANY_REQUESTS:
      spdlog::debug("Vendor API rate limited");
      return {};
    default:
      spdlog::debug("Vendor API returned HTTP {} for {}", resp.status, oui);
      return {};
  }
}
