#include "socket_util.hpp"
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_blocking(socket_t sock, bool blocking) {
#ifdef _WIN32
    u_long mode = blocking ? 0 : 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    if (blocking) flags &= ~O_NONBLOCK;
    else flags |= O_NONBLOCK;
    fcntl(sock, F_SETFL, flags);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_secs) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addrs = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);
    if (gai != 0 || !addrs) {
        return Result<socket_t>::Err(fmt::format("Failed to resolve host: {}", host));
    }

    std::string last_error = "no usable address";
    for (struct addrinfo* ai = addrs; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == SSHFAKE_INVALID_SOCKET) {
            last_error = "Failed to create socket";
            continue;
        }
        set_blocking(sock, false);

        int ret = ::connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int revents = poll_socket(sock, POLLOUT, timeout_secs * 1000);
            if (revents == 0) {
                last_error = "Connection timed out";
                close_socket(sock);
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
            if (sock_err != 0) {
                last_error = std::strerror(sock_err);
                close_socket(sock);
                continue;
            }
        }

        freeaddrinfo(addrs);
        return Result<socket_t>::Ok(sock);
    }

    freeaddrinfo(addrs);
    return Result<socket_t>::Err(fmt::format("Failed to connect to {}:{}: {}", host, port, last_error));
}

} // namespace platform
