#pragma once
#include "tvdeck/net/NetConfig.hpp"
#include "tvdeck/net/Deadline.hpp"
#include "tvdeck/net/NetService.hpp"
#include "tvdeck/log/Log.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace tvdeck::net {

/**
 * @brief Thin wrapper around `tcp::socket` that adds deadlines.
 *
 * Highlights:
 * - `connect(...)` tries each endpoint and respects a per-attempt timeout.
 * - `read_exact(...)`, `read_some(...)` and `write_all(...)` block the caller
 *   while enforcing deadlines.
 * - `read_to_end(...)` drains a stream the peer terminates by closing, which
 *   is how the device transport delivers command output.
 * - All socket work is serialized by a strand executor.
 *
 * The owning `asio::io_context` must be running while the API is used.
 */
class TcpClient {
public:
    TcpClient()
    : io_(shared_io_context())
    , socket_(*io_)
    , strand_(asio::make_strand(*io_))
    , defaultTimeout_(kDefaultSocketTimeout)
    , connectTimeout_(kDefaultSocketTimeout)
    {}

    ~TcpClient() { close(); }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    void setDefaultTimeout(duration timeout) {
        defaultTimeout_ = sanitize(timeout);
    }

    duration defaultTimeout() const { return defaultTimeout_; }

    void setConnectTimeout(duration timeout) {
        connectTimeout_ = sanitize(timeout);
    }

    duration connectTimeout() const { return connectTimeout_; }

    std::error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        socket_ = tcp::socket(strand_);
        return connect_one(endpoint, timeout);
    }

    std::error_code connect(const tcp::endpoint& endpoint) {
        return connect(endpoint, connectTimeout_);
    }

    // Resolver results: try each entry, keep the last failure.
    std::error_code connect(const tcp::resolver::results_type& results, duration timeout) {
        std::error_code last = asio::error::host_not_found;
        for (const auto& entry : results) {
            auto ec = connect(entry.endpoint(), timeout);
            if (!ec) return ec;
            last = ec;
        }
        return last;
    }

    std::error_code read_exact(void* buf, std::size_t n, duration timeout,
                               std::size_t* bytesTransferredOut = nullptr) {
        auto ex = socket_.get_executor();
        // Shared so a completion that lands after a timeout has somewhere to write.
        auto bytesTransferred = std::make_shared<std::size_t>(0);
        auto ec = with_deadline(ex, sanitize(timeout),
            [&](auto completion){
                asio::async_read(socket_, asio::buffer(buf, n),
                    [bytesTransferred, completion](const std::error_code& op_ec, std::size_t transferred){
                        *bytesTransferred = transferred;
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );
        if (bytesTransferredOut) {
            *bytesTransferredOut = *bytesTransferred;
        }
        return ec;
    }

    std::error_code read_some(void* buf, std::size_t n, duration timeout,
                              std::size_t& bytesTransferred) {
        auto ex = socket_.get_executor();
        bytesTransferred = 0;
        auto transferred = std::make_shared<std::size_t>(0);
        auto ec = with_deadline(ex, sanitize(timeout),
            [&](auto completion){
                socket_.async_read_some(asio::buffer(buf, n),
                    [transferred, completion](const std::error_code& op_ec, std::size_t count){
                        *transferred = count;
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );
        bytesTransferred = *transferred;
        return ec;
    }

    /**
     * @brief Append everything the peer sends until it closes the stream.
     *
     * The whole drain shares one deadline. EOF is success; hitting @p limit
     * reports `message_size`.
     */
    std::error_code read_to_end(std::vector<std::uint8_t>& out, duration timeout,
                                std::size_t limit) {
        const auto deadline = std::chrono::steady_clock::now() + sanitize(timeout);
        std::uint8_t chunk[16 * 1024];
        for (;;) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return asio::error::timed_out;
            }
            const auto remaining = std::chrono::duration_cast<duration>(deadline - now);
            std::size_t received = 0;
            auto ec = read_some(chunk, sizeof(chunk), remaining, received);
            out.insert(out.end(), chunk, chunk + received);
            if (ec == asio::error::eof) {
                return {};
            }
            if (ec) {
                return ec;
            }
            if (out.size() > limit) {
                return asio::error::message_size;
            }
        }
    }

    std::error_code write_all(const void* buf, std::size_t n, duration timeout) {
        auto ex = socket_.get_executor();
        return with_deadline(ex, sanitize(timeout),
            [&](auto completion){
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const std::error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );
    }

    std::error_code read_exact(void* buf, std::size_t n, std::size_t* bytesTransferredOut = nullptr) {
        return read_exact(buf, n, defaultTimeout_, bytesTransferredOut);
    }

    std::error_code write_all(const void* buf, std::size_t n) {
        return write_all(buf, n, defaultTimeout_);
    }

    void setLowLatency() {
        std::error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);
    }

    bool is_open() const { return socket_.is_open(); }

    // Best-effort cancellation of pending ops on the socket.
    void cancel() {
        std::error_code ec;
        socket_.cancel(ec);
    }

    void close() {
        if (!socket_.is_open()) return;
        std::error_code ec;
        // cancel -> shutdown -> close
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    std::error_code connect_one(const tcp::endpoint& ep, duration timeout) {
        auto ex = socket_.get_executor();
        return with_deadline(ex, sanitize(timeout),
            [&](auto completion){ socket_.async_connect(ep, completion); },
            [this]{ cancel(); }
        );
    }

    std::shared_ptr<asio::io_context> io_;
    tcp::socket socket_;
    asio::strand<asio::io_context::executor_type> strand_;
    duration defaultTimeout_;
    duration connectTimeout_;
};

} // namespace tvdeck::net
