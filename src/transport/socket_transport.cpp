#include <cfs_bridge/transport/socket_transport.hpp>

#include <cfs_bridge/core/log.hpp>

#include <cerrno>
#include <cstring>
#include <memory>

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

namespace cfs_bridge {

namespace {

constexpr const char* kComponent = "transport";

#ifdef POLLRDHUP
constexpr short kHangupEvents = POLLHUP | POLLRDHUP | POLLERR;
#else
constexpr short kHangupEvents = POLLHUP | POLLERR;
#endif

timeval ToTimeval(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

Error MakeTransportError(const std::string& operation,
                         const std::string& endpoint,
                         const std::string& message) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt,
                 ErrorCategory::Transport, std::nullopt};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// UniqueFd
// ---------------------------------------------------------------------------
void UniqueFd::Reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

// ---------------------------------------------------------------------------
// SocketTransport
// ---------------------------------------------------------------------------
SocketTransport::SocketTransport(Endpoint endpoint)
    : endpoint_(std::move(endpoint)) {}

SocketTransport::~SocketTransport() = default;

std::string SocketTransport::Describe() const {
    return endpoint_.ToString();
}

Result<UniqueFd, Error> SocketTransport::ConnectUnix() const {
    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd.Valid()) {
        return Result<UniqueFd, Error>::Err(
            Error::FromErrno("Connect", Describe(), "socket() failed", errno));
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, endpoint_.Path().c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd.Get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        return Result<UniqueFd, Error>::Err(
            Error::FromErrno("Connect", Describe(), "connect() failed", errno));
    }
    return Result<UniqueFd, Error>::Ok(std::move(fd));
}

Result<UniqueFd, Error> SocketTransport::ConnectTcp() const {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    const auto port = std::to_string(endpoint_.Port());
    int rc = ::getaddrinfo(endpoint_.Host().c_str(), port.c_str(), &hints, &raw);
    if (rc != 0) {
        return Result<UniqueFd, Error>::Err(MakeTransportError(
            "Connect", Describe(),
            std::string("Cannot resolve host: ") + ::gai_strerror(rc)));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> list(raw, &::freeaddrinfo);

    int last_errno = ECONNREFUSED;
    for (auto* ai = list.get(); ai != nullptr; ai = ai->ai_next) {
        UniqueFd fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                             ai->ai_protocol));
        if (!fd.Valid()) {
            last_errno = errno;
            continue;
        }
        if (::connect(fd.Get(), ai->ai_addr, ai->ai_addrlen) == 0) {
            return Result<UniqueFd, Error>::Ok(std::move(fd));
        }
        last_errno = errno;
    }
    return Result<UniqueFd, Error>::Err(
        Error::FromErrno("Connect", Describe(), "connect() failed", last_errno));
}

Result<void, Error> SocketTransport::Open(std::chrono::milliseconds read_timeout) {
    // Release the previous socket before creating a new one.
    Close();

    auto connected = endpoint_.GetKind() == Endpoint::Kind::UnixSocket
                         ? ConnectUnix()
                         : ConnectTcp();
    if (connected.IsErr()) {
        return Result<void, Error>::Err(std::move(connected).Error());
    }
    auto fd = std::move(connected).Value();

    const auto tv = ToTimeval(read_timeout);
    if (::setsockopt(fd.Get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(fd.Get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        return Result<void, Error>::Err(
            Error::FromErrno("Connect", Describe(), "setsockopt() failed", errno));
    }

    fd_ = std::move(fd);
    LogDebug(kComponent, "Socket open to " + Describe());
    return Result<void, Error>::Ok();
}

Result<void, Error> SocketTransport::Send(std::string_view bytes) {
    if (!fd_.Valid()) {
        return Result<void, Error>::Err(
            MakeTransportError("Send", Describe(), "Not connected"));
    }
    std::size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::send(fd_.Get(), bytes.data() + sent, bytes.size() - sent,
                           MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return Result<void, Error>::Err(Error::FromErrno(
                    "Send", Describe(), "Timeout sending request to cFS", errno));
            }
            return Result<void, Error>::Err(
                Error::FromErrno("Send", Describe(), "send() failed", errno));
        }
        sent += static_cast<std::size_t>(n);
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> SocketTransport::Receive(std::size_t max_bytes) {
    if (!fd_.Valid()) {
        return Result<std::string, Error>::Err(
            MakeTransportError("Receive", Describe(), "Not connected"));
    }
    std::string buffer(max_bytes, '\0');
    for (;;) {
        ssize_t n = ::recv(fd_.Get(), buffer.data(), buffer.size(), 0);
        if (n >= 0) {
            buffer.resize(static_cast<std::size_t>(n));
            return Result<std::string, Error>::Ok(std::move(buffer));
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            auto err = MakeTransportError("Receive", Describe(),
                                          "Timeout waiting for cFS response");
            err.sys_errno = errno;
            return Result<std::string, Error>::Err(std::move(err));
        }
        return Result<std::string, Error>::Err(
            Error::FromErrno("Receive", Describe(), "recv() failed", errno));
    }
}

bool SocketTransport::PeerClosed() noexcept {
    if (!fd_.Valid()) {
        return false;
    }
    pollfd pfd{};
    pfd.fd = fd_.Get();
    pfd.events = static_cast<short>(POLLIN | kHangupEvents);
    int rc = ::poll(&pfd, 1, 0);
    if (rc <= 0) {
        // Nothing pending (or poll itself failed): treat the stream as live
        // and let the exchange report any real error.
        return false;
    }
    if ((pfd.revents & kHangupEvents) != 0) {
        return true;
    }
    // Readable with no request outstanding: EOF shows up as a zero-byte peek.
    char byte = 0;
    ssize_t n = ::recv(fd_.Get(), &byte, 1, MSG_PEEK | MSG_DONTWAIT);
    return n == 0;
}

void SocketTransport::Close() noexcept {
    fd_.Reset();
}

} // namespace cfs_bridge
