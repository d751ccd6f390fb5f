#include "DualBackendScanner.h"

#include <exception>
#include <future>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

#include "MacAddress.h"

DualBackendScanner::DualBackendScanner(ScanBackend& primary, ScanBackend& secondary, VendorResolver& vendors)
  : _primary(primary), _secondary(secondary), _vendors(vendors) {}

std::vector<ScannedDevice> DualBackendScanner::RunBackend(ScanBackend& backend) {
  std::vector<ScannedDevice> out;
  try {
    if (!backend.scan(out)) {
      spdlog::debug("{} backend produced no results this cycle", ScanBackendName(backend.kind()));
      out.clear();
    }
  } catch (const std::exception& e) {
    spdlog::error("{} scan error: {}", ScanBackendName(backend.kind()), e.what());
    out.clear();
  }
  for (auto& d : out) {
    d.backend = backend.kind();
    d.mac = MacAddress::Normalize(d.mac);
  }
  return out;
}

std::vector<ScannedDevice> DualBackendScanner::Merge(std::vector<ScannedDevice> primary,
                                                     std::vector<ScannedDevice> secondary) {
  std::vector<ScannedDevice> merged;
  merged.reserve(primary.size() + secondary.size());
  std::unordered_set<std::string> seen;

  for (auto* list : { &primary, &secondary }) {
    for (auto& d : *list) {
      if (seen.insert(d.mac).second) merged.push_back(std::move(d));
    }
  }
  return merged;
}

std::vector<ScannedDevice> DualBackendScanner::scan() {
  auto fa = std::async(std::launch::async, [this] { return RunBackend(_primary); });
  auto fb = std::async(std::launch::async, [this] { return RunBackend(_secondary); });

  std::vector<ScannedDevice> a = fa.get();
  std::vector<ScannedDevice> b = fb.get();
  const size_t na = a.size();
  const size_t nb = b.size();

  std::vector<ScannedDevice> merged = Merge(std::move(a), std::move(b));

  for (auto& d : merged) {
    if (d.vendor.empty()) d.vendor = _vendors.resolve(d.mac);
  }

  spdlog::info("Scan complete: {} {} + {} {} = {} unique devices",
               na, ScanBackendName(_primary.kind()), nb, ScanBackendName(_secondary.kind()), merged.size());
  return merged;
}
