#pragma once

#include "sendme/core/result.hpp"
#include "sendme/events/event_queue.hpp"
#include "sendme/get/transfer_event.hpp"
#include "sendme/net/protocol.hpp"
#include "sendme/net/ticket.hpp"
#include "sendme/store/store.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sendme::net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using TransferFeed = events::ThreadSafeQueue<get::TransferEvent>;

/**
 * @brief Blocking client for one provider connection
 *
 * connect() tries the ticket's addresses in order and checks the provider's
 * node id against the ticket. fetch() is meant to run on a worker thread
 * while the caller drains the TransferFeed.
 */
class Getter {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static Result<std::unique_ptr<Getter>> connect(asio::io_context& io_context, const Ticket& ticket);

    /// Use connect(); the tag keeps construction inside this class.
    Getter(PrivateTag, tcp::socket socket, store::HashAndFormat content, std::string remote);

    ~Getter();

    Getter(const Getter&) = delete;
    Getter& operator=(const Getter&) = delete;

    /**
     * @brief Sizes of the ticket's blobs
     *
     * For a collection these are the sizes of the root's children,
     * metadata blob included.
     */
    Result<std::vector<std::uint64_t>> fetch_sizes();

    /**
     * @brief Download the ticket's content into @p store
     *
     * Every blob is verified against its hash before it is committed.
     * Progress is pushed onto @p feed, which is closed on return whether the
     * download succeeded or not; on failure the last event is Aborted.
     *
     * RETURNS: a temp tag protecting the downloaded root
     */
    Result<store::TempTag> fetch(store::Store& store, TransferFeed& feed);

    const std::string& remote() const { return remote_; }

private:
    Result<store::TempTag> download(store::Store& store, TransferFeed& feed);

    /// Receive one frame into the store, pushing item events for @p index.
    Result<store::TempTag> receive_item(store::Store& store,
                                        TransferFeed& feed,
                                        const store::Hash& expected,
                                        std::uint64_t index);

    Result<void> send_request(RequestKind kind);
    Result<void> expect_ok();
    Result<void> read_exact(std::uint8_t* data, std::size_t size);
    Result<std::uint64_t> read_frame_header();

    tcp::socket socket_;
    store::HashAndFormat content_;
    std::string remote_;
    std::uint64_t payload_received_ = 0;
};

} // namespace sendme::net
