#pragma once

#include <cfs_bridge/core/types.hpp>
#include <cfs_bridge/transport/i_transport.hpp>

namespace cfs_bridge {

// ---------------------------------------------------------------------------
// UniqueFd — owns a POSIX file descriptor; closes it on destruction/reset.
// ---------------------------------------------------------------------------
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { Reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            Reset(other.Release());
        }
        return *this;
    }

    [[nodiscard]] int Get() const noexcept { return fd_; }
    [[nodiscard]] bool Valid() const noexcept { return fd_ >= 0; }

    int Release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void Reset(int fd = -1) noexcept;

private:
    int fd_ = -1;
};

// ---------------------------------------------------------------------------
// SocketTransport — ITransport over a Unix-domain or TCP stream socket.
// ---------------------------------------------------------------------------
class SocketTransport : public ITransport {
public:
    explicit SocketTransport(Endpoint endpoint);
    ~SocketTransport() override;

    [[nodiscard]] Result<void, Error> Open(
        std::chrono::milliseconds read_timeout) override;
    [[nodiscard]] Result<void, Error> Send(std::string_view bytes) override;
    [[nodiscard]] Result<std::string, Error> Receive(std::size_t max_bytes) override;
    void Close() noexcept override;
    [[nodiscard]] bool IsOpen() const noexcept override { return fd_.Valid(); }
    [[nodiscard]] bool PeerClosed() noexcept override;
    [[nodiscard]] std::string Describe() const override;

private:
    Result<UniqueFd, Error> ConnectUnix() const;
    Result<UniqueFd, Error> ConnectTcp() const;

    Endpoint endpoint_;
    UniqueFd fd_;
};

} // namespace cfs_bridge
