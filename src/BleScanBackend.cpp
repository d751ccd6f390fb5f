#include "BleScanBackend.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <map>
#include <utility>

extern "C" {
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
}

#include <spdlog/spdlog.h>

#include "AdvertisingData.h"
#include "MacAddress.h"

// ----------------------------- Tuning -----------------------------

static constexpr uint8_t  SCAN_TYPE_ACTIVE   = 0x01;
static constexpr uint16_t SCAN_INTERVAL      = 0x0010; // 10 ms
static constexpr uint16_t SCAN_WINDOW        = 0x0010;
static constexpr uint8_t  FILTER_POLICY_ALL  = 0x00;
static constexpr uint8_t  FILTER_DUP_OFF     = 0x00;   // we aggregate per address ourselves
static constexpr int      HCI_TIMEOUT_MS     = 1000;

// ----------------------------- Helpers -----------------------------

namespace {

// Restores the socket filter and closes the device on every exit path.
class HciScanSession {
public:
  HciScanSession() = default;
  ~HciScanSession() { close(); }

  bool open(int dev_id) {
    _dd = hci_open_dev(dev_id);
    return _dd >= 0;
  }

  bool startScan() {
    if (hci_le_set_scan_parameters(_dd, SCAN_TYPE_ACTIVE, htobs(SCAN_INTERVAL), htobs(SCAN_WINDOW),
                                   LE_PUBLIC_ADDRESS, FILTER_POLICY_ALL, HCI_TIMEOUT_MS) < 0) {
      return false;
    }
    if (hci_le_set_scan_enable(_dd, 0x01, FILTER_DUP_OFF, HCI_TIMEOUT_MS) < 0) return false;
    _scanning = true;

    socklen_t olen = sizeof(_oldFilter);
    _haveOldFilter = getsockopt(_dd, SOL_HCI, HCI_FILTER, &_oldFilter, &olen) == 0;

    struct hci_filter nf;
    hci_filter_clear(&nf);
    hci_filter_set_ptype(HCI_EVENT_PKT, &nf);
    hci_filter_set_event(EVT_LE_META_EVENT, &nf);
    return setsockopt(_dd, SOL_HCI, HCI_FILTER, &nf, sizeof(nf)) == 0;
  }

  int fd() const { return _dd; }

  void close() {
    if (_dd < 0) return;
    if (_haveOldFilter) setsockopt(_dd, SOL_HCI, HCI_FILTER, &_oldFilter, sizeof(_oldFilter));
    if (_scanning && hci_le_set_scan_enable(_dd, 0x00, FILTER_DUP_OFF, HCI_TIMEOUT_MS) < 0) {
      spdlog::debug("Could not disable LE scan: {}", std::strerror(errno));
    }
    hci_close_dev(_dd);
    _dd = -1;
  }

private:
  int _dd = -1;
  bool _scanning = false;
  bool _haveOldFilter = false;
  struct hci_filter _oldFilter{};
};

void merge_report(std::map<std::string, ScannedDevice>& seen, const le_advertising_info* info, int8_t rssi) {
  char addr[18]{};
  ba2str(&info->bdaddr, addr);
  const std::string mac = MacAddress::Normalize(addr);

  AdvertisingFields fields;
  ParseAdvertisingData(info->data, info->length, fields);

  ScannedDevice& d = seen[mac];
  d.mac = mac;
  d.backend = ScanBackendKind::Ble;
  d.rssi = rssi;
  if (!fields.name.empty()) d.name = fields.name;
  for (auto& u : fields.service_uuids) {
    bool have = false;
    for (const auto& x : d.service_uuids) {
      if (x == u) { have = true; break; }
    }
    if (!have) d.service_uuids.push_back(std::move(u));
  }
}

// Walks the advertising reports of one LE meta event.
void parse_event(std::map<std::string, ScannedDevice>& seen, const uint8_t* buf, int len) {
  const int hdr = 1 + HCI_EVENT_HDR_SIZE;
  if (len < hdr + 2) return;

  const auto* meta = reinterpret_cast<const evt_le_meta_event*>(buf + hdr);
  if (meta->subevent != EVT_LE_ADVERTISING_REPORT) return;

  const uint8_t* p = meta->data + 1;
  const uint8_t* end = buf + len;
  const uint8_t num_reports = meta->data[0];

  for (uint8_t i = 0; i < num_reports; ++i) {
    if (p + LE_ADVERTISING_INFO_SIZE > end) break;
    const auto* info = reinterpret_cast<const le_advertising_info*>(p);
    if (p + LE_ADVERTISING_INFO_SIZE + info->length + 1 > end) break;

    const int8_t rssi = (int8_t)info->data[info->length];
    merge_report(seen, info, rssi);

    p += LE_ADVERTISING_INFO_SIZE + info->length + 1;
  }
}

} // namespace

// ----------------------------- BleScanBackend -----------------------------

BleScanBackend::BleScanBackend(std::string adapter, int duration_s)
  : _adapter(std::move(adapter)), _durationS(duration_s) {}

bool BleScanBackend::scan(std::vector<ScannedDevice>& out) {
  const int dev_id = _adapter.empty() ? hci_get_route(nullptr) : hci_devid(_adapter.c_str());
  if (dev_id < 0) {
    spdlog::error("BLE scan error: no HCI adapter {}", _adapter.empty() ? "available" : _adapter);
    return false;
  }

  HciScanSession session;
  if (!session.open(dev_id)) {
    spdlog::error("BLE scan error: cannot open hci{}: {}", dev_id, std::strerror(errno));
    return false;
  }
  if (!session.startScan()) {
    spdlog::error("BLE scan error: cannot start LE scan: {}", std::strerror(errno));
    return false;
  }

  std::map<std::string, ScannedDevice> seen;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(_durationS);

  for (;;) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) break;

    struct pollfd pfd{ session.fd(), POLLIN, 0 };
    const int rc = poll(&pfd, 1, (int)remaining);
    if (rc < 0) {
      if (errno == EINTR) continue;
      spdlog::error("BLE scan error: poll: {}", std::strerror(errno));
      return false;
    }
    if (rc == 0) break;

    uint8_t buf[HCI_MAX_EVENT_SIZE];
    const ssize_t len = read(session.fd(), buf, sizeof(buf));
    if (len < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      spdlog::error("BLE scan error: read: {}", std::strerror(errno));
      return false;
    }
    parse_event(seen, buf, (int)len);
  }

  for (auto& kv : seen) out.push_back(std::move(kv.second));
  spdlog::debug("BLE scan: found {} devices", out.size());
  return true;
}
