#pragma once

#include "sendme/core/result.hpp"
#include "sendme/events/event_bus.hpp"
#include "sendme/net/protocol.hpp"
#include "sendme/net/secret_key.hpp"
#include "sendme/store/store.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace sendme::net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief One accepted getter
 *
 * Lifecycle:
 * 1. Created when the acceptor hands over a socket
 * 2. start() writes the hello frame
 * 3. Requests are read and answered one at a time until the peer hangs up
 *
 * Every pending async operation holds a shared_ptr to the connection, so it
 * is destroyed once the last callback returns without scheduling more work.
 */
class ProviderConnection : public std::enable_shared_from_this<ProviderConnection> {
public:
    ProviderConnection(tcp::socket socket,
                       store::Store& store,
                       events::EventBus& bus,
                       const NodeId& node_id,
                       std::uint64_t id);

    void start();

private:
    void do_write_hello();
    void do_read_request();
    void handle_request(const Request& request);

    void answer_sizes(const Request& request);
    void answer_get(const Request& request);
    void answer_error(ResponseStatus status, const std::string& reason);

    void do_write_frame_header();
    void do_write_chunk();
    void finish_blob();

    void abort(const std::string& reason);

    /// Hashes of every blob a get request streams, root first.
    Result<std::vector<store::Hash>> blobs_for(const store::HashAndFormat& content) const;

    tcp::socket socket_;
    store::Store& store_;
    events::EventBus& bus_;
    NodeId node_id_;
    std::uint64_t id_;
    std::string remote_;

    std::array<std::uint8_t, kRequestSize> request_buffer_{};

    // state of the get request currently being streamed
    store::HashAndFormat serving_;
    std::vector<store::Hash> pending_;
    std::size_t blob_index_ = 0;
    std::ifstream blob_file_;
    std::uint64_t blob_remaining_ = 0;
    std::uint64_t bytes_sent_ = 0;
    std::chrono::steady_clock::time_point started_;
    std::vector<std::uint8_t> chunk_;
};

/**
 * @brief Serves blobs from a store to any getter that connects
 *
 * Architecture:
 * - Async accept on the caller's io_context
 * - One ProviderConnection per peer
 * - Lifecycle events published on the EventBus
 *
 * Thread safety:
 * - All callbacks run on the io_context thread(s)
 * - stop() must be called from an io_context thread (post it otherwise)
 *
 * Usage:
 * ```cpp
 * asio::io_context io;
 * auto provider = Provider::bind(io, store, bus, key.node_id(), "0.0.0.0", 0);
 * provider.value()->start();
 * io.run();
 * ```
 */
class Provider {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Open the listening socket
     *
     * Port 0 picks an ephemeral port; port() reports the one chosen.
     */
    static Result<std::unique_ptr<Provider>> bind(asio::io_context& io_context,
                                                  store::Store& store,
                                                  events::EventBus& bus,
                                                  const NodeId& node_id,
                                                  const std::string& address,
                                                  std::uint16_t port);

    /// Use bind(); the tag keeps construction inside this class.
    Provider(PrivateTag,
             asio::io_context& io_context,
             tcp::acceptor acceptor,
             store::Store& store,
             events::EventBus& bus,
             const NodeId& node_id);

    Provider(const Provider&) = delete;
    Provider& operator=(const Provider&) = delete;

    void start();
    void stop();

    uint16_t port() const { return port_; }
    const std::string& address() const { return address_; }

    /**
     * Addresses to put into a ticket. An unspecified bind address expands to
     * loopback plus every IPv4 address the local host name resolves to.
     */
    std::vector<std::string> advertised_addresses() const;

    std::uint64_t connections_accepted() const { return next_connection_id_.load(); }

private:
    void do_accept();

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    store::Store& store_;
    events::EventBus& bus_;
    NodeId node_id_;
    std::string address_;
    uint16_t port_ = 0;
    std::atomic<std::uint64_t> next_connection_id_{0};
    bool stopped_ = false;
};

} // namespace sendme::net
