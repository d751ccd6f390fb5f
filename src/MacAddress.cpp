#include "MacAddress.h"

#include <cctype>

namespace
{
  int HexVal(char ch)
  {
    if (ch >= '0' && ch <= '9') return ch - '0';
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    if (ch >= 'A' && ch <= 'F') return 10 + (ch - 'A');
    return -1;
  }

  // Parse exactly 2 hex chars into a byte. Returns true on success.
  bool ParseHexByte(std::string_view s, std::uint8_t& out)
  {
    if (s.size() != 2)
      return false;

    const int hi = HexVal(s[0]);
    const int lo = HexVal(s[1]);
    if (hi < 0 || lo < 0)
      return false;

    out = static_cast<std::uint8_t>((hi << 4) | lo);
    return true;
  }

  // Parse the leading `count` colon-separated octets.
  bool ParseOctets(std::string_view s, int count, std::uint8_t* out)
  {
    if (s.size() < static_cast<std::size_t>(count * 3 - 1))
      return false;

    for (int i = 0; i < count; ++i)
    {
      const std::size_t off = static_cast<std::size_t>(i) * 3;
      if (i > 0 && s[off - 1] != ':')
        return false;

      if (!ParseHexByte(s.substr(off, 2), out[i]))
        return false;
    }
    return true;
  }
}

bool MacAddress::TryParse(std::string_view mac, std::array<std::uint8_t, 6>& out)
{
  if (mac.size() != 17)
    return false;
  return ParseOctets(mac, 6, out.data());
}

std::string MacAddress::Normalize(std::string_view address)
{
  std::string s(address);
  for (char& c : s) c = (char)std::toupper((unsigned char)c);
  return s;
}

bool MacAddress::IsProxyIdentifier(std::string_view address)
{
  static constexpr int GROUPS[] = { 8, 4, 4, 4, 12 };

  if (address.size() != 36)
    return false;

  std::size_t pos = 0;
  for (int g = 0; g < 5; ++g)
  {
    if (g > 0)
    {
      if (address[pos] != '-') return false;
      ++pos;
    }
    for (int i = 0; i < GROUPS[g]; ++i, ++pos)
    {
      if (HexVal(address[pos]) < 0) return false;
    }
  }
  return pos == address.size();
}

bool MacAddress::IsLocallyAdministered(std::string_view address)
{
  if (IsProxyIdentifier(address))
    return false;

  if (address.size() < 3 || address[2] != ':')
    return false;

  std::uint8_t first = 0;
  if (!ParseHexByte(address.substr(0, 2), first))
    return false;

  return (first & 0x02) != 0;
}

std::string MacAddress::OuiPrefix(std::string_view address)
{
  std::uint8_t octets[3]{};
  if (!ParseOctets(address, 3, octets))
    return {};

  return Normalize(address.substr(0, 8));
}
