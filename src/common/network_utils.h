#pragma once

#include <string>
#include <utility>

namespace XtSim {

/**
 * Parses address and port from a string in format "address:port"
 * @throws std::invalid_argument on a missing colon or non-numeric port
 * @throws std::out_of_range if the port is outside 0-65535
 */
std::pair<std::string, int> ParseAddressPort(const std::string& input);

/**
 * Opens a TCP connection to host:port.
 * The connect is issued non-blocking and bounded by timeout_ms; the returned
 * socket is switched back to blocking mode with TCP_NODELAY set.
 * @param host Hostname or IPv4 address, resolved with getaddrinfo
 * @param port Port to connect to
 * @param timeout_ms Upper bound on the connect handshake
 * @return Socket file descriptor or -1 on error (logged)
 */
int ConnectWithTimeout(const std::string& host, int port, int timeout_ms);

} // namespace XtSim
