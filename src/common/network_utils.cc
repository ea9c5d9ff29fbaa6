#include "network_utils.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

namespace XtSim {

std::pair<std::string, int> ParseAddressPort(const std::string& input) {
    size_t colonPos = input.rfind(':');
    if (colonPos == std::string::npos) {
        throw std::invalid_argument("Invalid input format. Expected 'address:port'");
    }

    std::string address = input.substr(0, colonPos);
    std::string portStr = input.substr(colonPos + 1);

    int port;
    try {
        port = std::stoi(portStr);
    } catch (const std::exception& e) {
        throw std::invalid_argument("Invalid port number: " + portStr);
    }

    if (port < 0 || port > 65535) {
        throw std::out_of_range("Port number out of valid range (0-65535): " + portStr);
    }

    return std::make_pair(address, port);
}

namespace {

bool SetBlocking(int sock, bool blocking) {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags == -1) {
        LOG(ERROR) << "fcntl F_GETFL failed: " << strerror(errno);
        return false;
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (fcntl(sock, F_SETFL, flags) == -1) {
        LOG(ERROR) << "fcntl F_SETFL failed: " << strerror(errno);
        return false;
    }
    return true;
}

// Waits for a non-blocking connect to finish. Returns 0 or the socket error.
int WaitForConnect(int sock, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = POLLOUT;
    pfd.revents = 0;

    int ready;
    do {
        ready = poll(&pfd, 1, timeout_ms);
    } while (ready < 0 && errno == EINTR);

    if (ready == 0) {
        return ETIMEDOUT;
    }
    if (ready < 0) {
        return errno;
    }

    int error = 0;
    socklen_t len = sizeof(error);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len) < 0) {
        return errno;
    }
    return error;
}

} // namespace

int ConnectWithTimeout(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        LOG(ERROR) << "Failed to resolve " << host << ": " << gai_strerror(rc);
        return -1;
    }

    int sock = -1;
    int last_error = 0;
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = errno;
            continue;
        }

        if (!SetBlocking(sock, false)) {
            close(sock);
            sock = -1;
            continue;
        }

        if (connect(sock, ai->ai_addr, ai->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                last_error = errno;
                close(sock);
                sock = -1;
                continue;
            }
            int error = WaitForConnect(sock, timeout_ms);
            if (error != 0) {
                last_error = error;
                close(sock);
                sock = -1;
                continue;
            }
        }
        break;
    }
    freeaddrinfo(result);

    if (sock < 0) {
        LOG(ERROR) << "Connect failed to " << host << ":" << port
                   << " - " << strerror(last_error);
        return -1;
    }

    if (!SetBlocking(sock, true)) {
        close(sock);
        return -1;
    }

    // Votes and decisions are tiny; disable Nagle's algorithm
    int flag = 1;
    if (setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) != 0) {
        LOG(WARNING) << "setsockopt(TCP_NODELAY) failed: " << strerror(errno);
    }

    return sock;
}

} // namespace XtSim
