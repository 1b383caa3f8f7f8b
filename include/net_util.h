#ifndef NET_UTIL_H
#define NET_UTIL_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace net {

int connectTcp(const std::string &host, uint16_t port, int timeoutMs,
               std::string &error);
void closeSocket(int sock);
void shutdownSocket(int sock);
void setRecvTimeoutMs(int sock, int timeoutMs);
bool sendAll(int sock, const char *data, size_t len);
bool sendLine(int sock, const std::string &line);
// Reads up to '\n' (stripped, '\r' dropped). Returns false on EOF or timeout
// with nothing read.
bool recvLine(int sock, std::string &line, size_t maxLen);
int lastSocketError();
bool socketInterrupted(int err);
bool socketWouldBlock(int err);
std::string peerAddress(int sock);

} // namespace net

#endif
