#include "ClassicScanBackend.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "MacAddress.h"

static constexpr const char* HCITOOL = "hcitool";

// One inquiry unit is 1.28 s; allow some slack for the tool itself.
static constexpr long INQUIRY_UNIT_MS  = 1280;
static constexpr long INQUIRY_SLACK_MS = 5000;

static std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace((unsigned char)s[b])) b++;
  while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
  return s.substr(b, e - b);
}

static bool icontains(const std::string& haystack, const char* needle) {
  std::string h = haystack;
  std::string n = needle;
  for (char& c : h) c = (char)std::tolower((unsigned char)c);
  for (char& c : n) c = (char)std::tolower((unsigned char)c);
  return h.find(n) != std::string::npos;
}

ClassicScanBackend::ClassicScanBackend(CommandRunner& runner,
                                       std::string adapter,
                                       int inquiry_length,
                                       long name_timeout_ms)
  : _runner(runner),
    _adapter(std::move(adapter)),
    _inquiryLength(inquiry_length),
    _nameTimeoutMs(name_timeout_ms) {}

std::vector<ClassicScanBackend::InquiryResult>
ClassicScanBackend::ParseInquiryOutput(const std::string& text) {
  static const std::regex LINE_RE(
    R"(([0-9A-Fa-f:]{17})\s+clock offset:.*class:\s*0x([0-9A-Fa-f]+))");

  std::vector<InquiryResult> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (trim(line).empty() || line.rfind("Inquiring", 0) == 0) continue;

    std::smatch m;
    if (!std::regex_search(line, m, LINE_RE)) continue;

    std::array<uint8_t, 6> bytes{};
    if (!MacAddress::TryParse(m[1].str(), bytes)) continue;

    InquiryResult r;
    r.mac = MacAddress::Normalize(m[1].str());
    try {
      r.device_class = (uint32_t)std::stoul(m[2].str(), nullptr, 16);
    } catch (const std::exception&) {
      continue;
    }

    const bool dup = std::any_of(out.begin(), out.end(),
                                 [&](const InquiryResult& x) { return x.mac == r.mac; });
    if (!dup) out.push_back(r);
  }
  return out;
}

std::vector<std::string> ClassicScanBackend::baseArgs() const {
  std::vector<std::string> args{ HCITOOL };
  if (!_adapter.empty()) {
    args.push_back("-i");
    args.push_back(_adapter);
  }
  return args;
}

std::string ClassicScanBackend::readName(const std::string& mac) {
  std::vector<std::string> args = baseArgs();
  args.push_back("name");
  args.push_back(mac);

  CommandResult res;
  if (!_runner.run(args, _nameTimeoutMs, res) || res.exit_code != 0) return {};
  return trim(res.out);
}

bool ClassicScanBackend::scan(std::vector<ScannedDevice>& out) {
  std::vector<std::string> args = baseArgs();
  args.push_back("inq");
  args.push_back("--length");
  args.push_back(std::to_string(_inquiryLength));

  const long timeout_ms = _inquiryLength * INQUIRY_UNIT_MS + INQUIRY_SLACK_MS;

  CommandResult res;
  if (!_runner.run(args, timeout_ms, res)) {
    if (res.not_found) {
      spdlog::debug("hcitool not found - classic Bluetooth scanning unavailable");
    } else if (res.timed_out) {
      spdlog::debug("Classic scan timed out");
    } else {
      spdlog::debug("Classic scan could not be started");
    }
    return false;
  }

  if (res.exit_code != 0) {
    const std::string msg = res.err.empty() ? "Unknown error" : trim(res.err);
    // Adapters without BR/EDR support answer "not configured"; nothing to report.
    if (!icontains(msg, "not configured")) {
      spdlog::debug("Classic scan unavailable: {}", msg);
    }
    return false;
  }

  for (const InquiryResult& r : ParseInquiryOutput(res.out)) {
    ScannedDevice d;
    d.mac = r.mac;
    d.name = readName(r.mac);
    d.rssi = PLACEHOLDER_RSSI;
    d.backend = ScanBackendKind::Classic;
    d.has_device_class = true;
    d.device_class = r.device_class;
    out.push_back(std::move(d));
  }

  spdlog::debug("Classic scan: found {} devices", out.size());
  return true;
}
