#include "address_matcher.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstring>
#include <iostream>

namespace {
bool isV4Mapped(const std::array<uint8_t, 16>& bytes) {
    for (int i = 0; i < 10; i++) {
        if (bytes[i] != 0) {
            return false;
        }
    }
    return bytes[10] == 0xff && bytes[11] == 0xff;
}

bool parsePrefix(const std::string& text, int maxBits, int& out) {
    if (text.empty() || text.size() > 3) {
        return false;
    }
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    if (value > maxBits) {
        return false;
    }
    out = value;
    return true;
}
}  // namespace

AddressMatcher::AddressMatcher(const std::vector<std::string>& entries) {
    for (const std::string& entry : entries) {
        if (!addEntry(entry)) {
            std::cerr << "[CLIENTS] ignoring unparsable local address entry: '" << entry << "'\n";
        }
    }
}

bool AddressMatcher::parseAddress(const std::string& text, int& family, std::array<uint8_t, 16>& bytes) {
    std::string host = text;
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    const size_t zone = host.find('%');
    if (zone != std::string::npos) {
        host = host.substr(0, zone);
    }
    if (host.empty()) {
        return false;
    }

    bytes.fill(0);
    struct in_addr v4;
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        family = AF_INET;
        std::memcpy(bytes.data(), &v4, 4);
        return true;
    }

    struct in6_addr v6;
    if (inet_pton(AF_INET6, host.c_str(), &v6) == 1) {
        std::memcpy(bytes.data(), &v6, 16);
        if (isV4Mapped(bytes)) {
            std::array<uint8_t, 16> mapped{};
            std::memcpy(mapped.data(), bytes.data() + 12, 4);
            bytes = mapped;
            family = AF_INET;
            return true;
        }
        family = AF_INET6;
        return true;
    }
    return false;
}

bool AddressMatcher::addEntry(const std::string& entry) {
    Range range;
    const size_t slash = entry.find('/');
    const std::string addressPart = slash == std::string::npos ? entry : entry.substr(0, slash);
    if (!parseAddress(addressPart, range.family, range.bytes)) {
        return false;
    }

    const int maxBits = range.family == AF_INET ? 32 : 128;
    range.prefixBits = maxBits;
    if (slash != std::string::npos && !parsePrefix(entry.substr(slash + 1), maxBits, range.prefixBits)) {
        return false;
    }

    m_ranges.push_back(range);
    return true;
}

bool AddressMatcher::prefixMatches(const Range& range, const std::array<uint8_t, 16>& bytes) {
    const int fullBytes = range.prefixBits / 8;
    const int remainingBits = range.prefixBits % 8;
    for (int i = 0; i < fullBytes; i++) {
        if (range.bytes[i] != bytes[i]) {
            return false;
        }
    }
    if (remainingBits == 0) {
        return true;
    }
    const uint8_t mask = static_cast<uint8_t>(0xFF << (8 - remainingBits));
    return (range.bytes[fullBytes] & mask) == (bytes[fullBytes] & mask);
}

bool AddressMatcher::isLocal(const std::string& address) const {
    int family = 0;
    std::array<uint8_t, 16> bytes{};
    if (!parseAddress(address, family, bytes)) {
        return false;
    }
    for (const Range& range : m_ranges) {
        if (range.family == family && prefixMatches(range, bytes)) {
            return true;
        }
    }
    return false;
}
