#ifndef ADDRESS_MATCHER_H
#define ADDRESS_MATCHER_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Classifies peer addresses against a set of exact addresses and CIDR
// ranges. IPv4-mapped IPv6 peers are matched as IPv4. Anything that does not
// parse is never local.
class AddressMatcher {
public:
  AddressMatcher() = default;
  explicit AddressMatcher(const std::vector<std::string> &entries);

  bool addEntry(const std::string &entry);
  bool isLocal(const std::string &address) const;
  size_t size() const { return m_ranges.size(); }

  static bool parseAddress(const std::string &text, int &family,
                           std::array<uint8_t, 16> &bytes);

private:
  struct Range {
    int family = 0;
    std::array<uint8_t, 16> bytes{};
    int prefixBits = 0;
  };

  static bool prefixMatches(const Range &range,
                            const std::array<uint8_t, 16> &bytes);

  std::vector<Range> m_ranges;
};

#endif
