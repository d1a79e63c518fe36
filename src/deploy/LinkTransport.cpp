#include <cargo3ds/deploy/LinkTransport.hpp>

#include <cargo3ds/proc/Process.hpp>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string_view>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace cargo3ds::deploy {

namespace {

constexpr std::string_view k_discover_ping = "3dsboot";
constexpr std::string_view k_discover_pong = "boot3ds";
constexpr int k_poll_ms = 100;
constexpr std::chrono::milliseconds k_ping_interval{1000};

// Closes the descriptor on scope exit.
class Socket {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() {
        if (fd_ >= 0) ::close(fd_);
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int get() const { return fd_; }
    bool ok() const { return fd_ >= 0; }
    int release() { return std::exchange(fd_, -1); }

private:
    int fd_ = -1;
};

sockaddr_in make_addr(uint32_t host_order_ip, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(host_order_ip);
    return addr;
}

bool set_nonblocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

bool write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        const ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

LinkTransport::LinkTransport(LinkSettings settings)
    : settings_(std::move(settings)) {}

LinkTransport::~LinkTransport() {
    if (listen_fd_ >= 0) ::close(listen_fd_);
}

std::optional<std::string> LinkTransport::discover(std::chrono::milliseconds timeout, const CancelToken& cancel) {
    Socket sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.ok()) return std::nullopt;

    int yes = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_BROADCAST, &yes, sizeof(yes)) != 0) return std::nullopt;

    const sockaddr_in broadcast = make_addr(INADDR_BROADCAST, k_link_port);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto next_ping = std::chrono::steady_clock::now();

    while (!cancel.cancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;

        if (now >= next_ping) {
            // A lost datagram is retried on the next interval.
            (void)::sendto(sock.get(), k_discover_ping.data(), k_discover_ping.size(), 0,
                           reinterpret_cast<const sockaddr*>(&broadcast), sizeof(broadcast));
            next_ping = now + k_ping_interval;
        }

        pollfd pfd{sock.get(), POLLIN, 0};
        const int rc = ::poll(&pfd, 1, k_poll_ms);
        if (rc < 0 && errno != EINTR) return std::nullopt;
        if (rc <= 0 || (pfd.revents & POLLIN) == 0) continue;

        char buf[64];
        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        const ssize_t n = ::recvfrom(sock.get(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &from_len);
        if (n <= 0) continue;
        if (std::string_view(buf, static_cast<size_t>(n)).substr(0, k_discover_pong.size()) != k_discover_pong) continue;

        char text[INET_ADDRSTRLEN] = {};
        if (inet_ntop(AF_INET, &from.sin_addr, text, sizeof(text)) == nullptr) continue;
        return std::string(text);
    }
    return std::nullopt;
}

bool LinkTransport::connect(const std::string& address, std::string& err) {
    sockaddr_in addr = make_addr(0, k_link_port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        err = "invalid IPv4 address '" + address + "'";
        return false;
    }

    Socket sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.ok()) {
        err = errno_text("socket");
        return false;
    }
    if (!set_nonblocking(sock.get())) {
        err = errno_text("fcntl");
        return false;
    }

    const int rc = ::connect(sock.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) return true;
    if (errno != EINPROGRESS) {
        err = errno_text("connect");
        return false;
    }

    pollfd pfd{sock.get(), POLLOUT, 0};
    const int prc = ::poll(&pfd, 1, static_cast<int>(settings_.connect_timeout.count()));
    if (prc == 0) {
        err = "timed out connecting to " + address;
        return false;
    }
    if (prc < 0) {
        err = errno_text("poll");
        return false;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
        err = "connect to " + address + ": " + std::strerror(so_error != 0 ? so_error : errno);
        return false;
    }
    return true;
}

bool LinkTransport::listen(std::string& err) {
    if (listen_fd_ >= 0) return true;

    Socket sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.ok()) {
        err = errno_text("socket");
        return false;
    }
    int yes = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
        err = errno_text("setsockopt");
        return false;
    }

    const sockaddr_in addr = make_addr(INADDR_ANY, k_link_port);
    if (::bind(sock.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        err = errno_text("bind");
        return false;
    }
    if (::listen(sock.get(), 4) != 0) {
        err = errno_text("listen");
        return false;
    }
    listen_fd_ = sock.release();
    return true;
}

std::vector<std::string> LinkTransport::link_argv(const std::string& address, const TransferRequest& req) const {
    std::vector<std::string> argv{settings_.link_tool, "--address", address};
    if (req.argv0.has_value()) {
        argv.push_back("--argv0");
        argv.push_back(*req.argv0);
    }
    argv.push_back(req.file.string());
    if (!req.exec_args.empty()) {
        argv.push_back("--");
        argv.insert(argv.end(), req.exec_args.begin(), req.exec_args.end());
    }
    return argv;
}

int LinkTransport::transfer(const std::string& address, const TransferRequest& req, std::string& err) {
    const auto argv = link_argv(address, req);
    std::string spawn_err{};
    const int rc = proc::run_argv(argv, {}, &spawn_err);
    if (rc != 0) err = spawn_err.empty() ? proc::format_command(argv) : spawn_err;
    return rc;
}

bool LinkTransport::serve(const CancelToken& cancel, std::string& err) {
    if (!listen(err)) return false;

    std::vector<pollfd> fds{{listen_fd_, POLLIN, 0}};
    char buf[4096];

    while (!cancel.cancelled()) {
        const int rc = ::poll(fds.data(), fds.size(), k_poll_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            err = errno_text("poll");
            break;
        }
        if (rc == 0) continue;

        for (size_t i = fds.size(); i-- > 1;) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            const ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0 && write_all(STDOUT_FILENO, buf, static_cast<size_t>(n))) continue;
            ::close(fds[i].fd);
            fds.erase(fds.begin() + static_cast<std::ptrdiff_t>(i));
        }

        if ((fds[0].revents & POLLIN) != 0) {
            const int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client >= 0) fds.push_back({client, POLLIN, 0});
        }
    }

    for (size_t i = 1; i < fds.size(); ++i) ::close(fds[i].fd);
    return err.empty();
}

} // namespace cargo3ds::deploy
