#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

// Hardware address helpers. Addresses travel as "AA:BB:CC:DD:EE:FF" strings.
// Some platforms hide the real address and hand out a per-device UUID instead
// ("proxy identifier"), which carries no manufacturer prefix.
class MacAddress {
public:
  // Strict "AA:BB:CC:DD:EE:FF" parse, case-insensitive.
  static bool TryParse(std::string_view mac, std::array<std::uint8_t, 6>& out);

  // Upper-cased copy; the canonical key for caches, merges and storage.
  static std::string Normalize(std::string_view address);

  // 8-4-4-4-12 hyphenated hex groups.
  static bool IsProxyIdentifier(std::string_view address);

  // Colon-separated hex whose first octet has the locally-administered bit set.
  static bool IsLocallyAdministered(std::string_view address);

  // First three octets ("AA:BB:CC"), upper-cased. Empty when the address does
  // not start with three colon-separated hex octets.
  static std::string OuiPrefix(std::string_view address);
};
