#include "sendme/net/provider.hpp"

#include "sendme/events/events.hpp"
#include "sendme/store/hash_seq.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sendme::net {

namespace {

std::string endpoint_string(const tcp::endpoint& endpoint) {
    const auto address = endpoint.address();
    const std::string host = address.is_v6() ? "[" + address.to_string() + "]" : address.to_string();
    return host + ":" + std::to_string(endpoint.port());
}

} // namespace

// ──────────────────────────────────────────────────────────
// ProviderConnection
// ──────────────────────────────────────────────────────────

ProviderConnection::ProviderConnection(tcp::socket socket,
                                       store::Store& store,
                                       events::EventBus& bus,
                                       const NodeId& node_id,
                                       std::uint64_t id)
    : socket_(std::move(socket))
    , store_(store)
    , bus_(bus)
    , node_id_(node_id)
    , id_(id)
    , chunk_(kChunkSize) {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : endpoint_string(endpoint);
}

void ProviderConnection::start() {
    do_write_hello();
}

void ProviderConnection::do_write_hello() {
    auto self = shared_from_this();
    auto data = std::make_shared<std::vector<std::uint8_t>>(encode_hello(node_id_));

    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data](boost::system::error_code ec, std::size_t) {
            if (ec) {
                abort("hello failed: " + ec.message());
                return;
            }
            bus_.emit(events::ClientConnectedEvent{id_, remote_});
            do_read_request();
        }
    );
}

void ProviderConnection::do_read_request() {
    auto self = shared_from_this();

    asio::async_read(
        socket_,
        asio::buffer(request_buffer_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec == asio::error::eof) {
                spdlog::debug("Connection {} closed by peer", id_);
                return;
            }
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                abort("read failed: " + ec.message());
                return;
            }

            auto request = decode_request(
                std::vector<std::uint8_t>(request_buffer_.begin(), request_buffer_.end()));
            if (request.is_error()) {
                answer_error(ResponseStatus::BadRequest, request.error().message);
                return;
            }

            handle_request(request.value());
        }
    );
}

void ProviderConnection::handle_request(const Request& request) {
    bus_.emit(events::RequestReceivedEvent{
        id_,
        request.kind == RequestKind::Sizes ? events::RequestReceivedEvent::Kind::Sizes
                                           : events::RequestReceivedEvent::Kind::Get,
        request.content.hash,
        request.content.format});

    if (request.kind == RequestKind::Sizes) {
        answer_sizes(request);
    } else {
        answer_get(request);
    }
}

Result<std::vector<store::Hash>> ProviderConnection::blobs_for(const store::HashAndFormat& content) const {
    using Hashes = std::vector<store::Hash>;

    if (!store_.contains(content.hash)) {
        return Err<Hashes>(ErrorKind::NotFound, "blob " + content.hash.to_hex() + " not found");
    }
    if (content.format == store::BlobFormat::Raw) {
        return Ok(Hashes{content.hash});
    }

    auto root = store_.read_blob(content.hash);
    if (root.is_error()) {
        return Err<Hashes>(root.error());
    }
    auto children = store::parse_hash_seq(root.value());
    if (children.is_error()) {
        return Err<Hashes>(children.error());
    }

    Hashes blobs;
    blobs.reserve(children.value().size() + 1);
    blobs.push_back(content.hash);
    for (const auto& child : children.value()) {
        if (!store_.contains(child)) {
            return Err<Hashes>(ErrorKind::NotFound, "child blob " + child.to_hex() + " not found");
        }
        blobs.push_back(child);
    }
    return Ok(std::move(blobs));
}

void ProviderConnection::answer_sizes(const Request& request) {
    auto blobs = blobs_for(request.content);
    if (blobs.is_error()) {
        answer_error(ResponseStatus::NotFound, blobs.error().message);
        return;
    }

    // for a HashSeq the sizes describe its children, not the root itself
    auto first = blobs.value().begin();
    if (request.content.format == store::BlobFormat::HashSeq) {
        ++first;
    }

    std::vector<std::uint64_t> sizes;
    for (auto it = first; it != blobs.value().end(); ++it) {
        auto size = store_.blob_size(*it);
        if (size.is_error()) {
            answer_error(ResponseStatus::NotFound, size.error().message);
            return;
        }
        sizes.push_back(size.value());
    }

    auto data = std::make_shared<std::vector<std::uint8_t>>();
    data->push_back(static_cast<std::uint8_t>(ResponseStatus::Ok));
    auto body = encode_sizes(sizes);
    data->insert(data->end(), body.begin(), body.end());

    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data](boost::system::error_code ec, std::size_t) {
            if (ec) {
                abort("write failed: " + ec.message());
                return;
            }
            do_read_request();
        }
    );
}

void ProviderConnection::answer_get(const Request& request) {
    auto blobs = blobs_for(request.content);
    if (blobs.is_error()) {
        answer_error(ResponseStatus::NotFound, blobs.error().message);
        return;
    }

    serving_ = request.content;
    pending_ = std::move(blobs.value());
    blob_index_ = 0;
    bytes_sent_ = 0;
    started_ = std::chrono::steady_clock::now();

    auto data = std::make_shared<std::vector<std::uint8_t>>(
        1, static_cast<std::uint8_t>(ResponseStatus::Ok));

    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data](boost::system::error_code ec, std::size_t) {
            if (ec) {
                abort("write failed: " + ec.message());
                return;
            }
            do_write_frame_header();
        }
    );
}

void ProviderConnection::answer_error(ResponseStatus status, const std::string& reason) {
    spdlog::debug("Connection {}: {} ({})", id_, status_name(status), reason);

    auto data = std::make_shared<std::vector<std::uint8_t>>(1, static_cast<std::uint8_t>(status));
    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data, reason](boost::system::error_code, std::size_t) {
            // the conversation cannot continue after an error status
            abort(reason);
        }
    );
}

void ProviderConnection::do_write_frame_header() {
    if (blob_index_ == pending_.size()) {
        const auto elapsed = std::chrono::steady_clock::now() - started_;
        bus_.emit(events::TransferCompletedEvent{
            id_,
            serving_.hash,
            static_cast<std::uint64_t>(pending_.size()),
            bytes_sent_,
            std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed)});
        pending_.clear();
        do_read_request();
        return;
    }

    const auto& hash = pending_[blob_index_];
    auto path = store_.blob_path(hash);
    auto size = store_.blob_size(hash);
    if (path.is_error() || size.is_error()) {
        abort("blob " + hash.to_hex() + " vanished while serving");
        return;
    }

    blob_file_.close();
    blob_file_.clear();
    blob_file_.open(path.value(), std::ios::binary);
    if (!blob_file_) {
        abort("cannot open blob " + hash.to_hex());
        return;
    }
    blob_remaining_ = size.value();

    auto header = std::make_shared<std::vector<std::uint8_t>>(encode_frame_header(blob_remaining_));
    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(*header),
        [this, self, header](boost::system::error_code ec, std::size_t) {
            if (ec) {
                abort("write failed: " + ec.message());
                return;
            }
            do_write_chunk();
        }
    );
}

void ProviderConnection::do_write_chunk() {
    if (blob_remaining_ == 0) {
        finish_blob();
        return;
    }

    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(blob_remaining_, chunk_.size()));
    blob_file_.read(reinterpret_cast<char*>(chunk_.data()), static_cast<std::streamsize>(want));
    if (static_cast<std::size_t>(blob_file_.gcount()) != want) {
        abort("short read from blob " + pending_[blob_index_].to_hex());
        return;
    }

    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(chunk_.data(), want),
        [this, self](boost::system::error_code ec, std::size_t written) {
            if (ec) {
                abort("write failed: " + ec.message());
                return;
            }
            bytes_sent_ += written;
            blob_remaining_ -= written;
            do_write_chunk();
        }
    );
}

void ProviderConnection::finish_blob() {
    blob_file_.close();
    ++blob_index_;
    do_write_frame_header();
}

void ProviderConnection::abort(const std::string& reason) {
    bus_.emit(events::TransferAbortedEvent{id_, reason});

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

// ──────────────────────────────────────────────────────────
// Provider
// ──────────────────────────────────────────────────────────

Result<std::unique_ptr<Provider>> Provider::bind(asio::io_context& io_context,
                                                 store::Store& store,
                                                 events::EventBus& bus,
                                                 const NodeId& node_id,
                                                 const std::string& address,
                                                 std::uint16_t port) {
    using Ptr = std::unique_ptr<Provider>;

    boost::system::error_code ec;
    const auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        return Err<Ptr>(ErrorKind::InvalidArgument, "invalid bind address '" + address + "'");
    }
    const tcp::endpoint endpoint(ip, port);

    tcp::acceptor acceptor(io_context);
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        return Err<Ptr>(ErrorKind::Network,
                        "failed to listen on " + endpoint_string(endpoint) + ": " + ec.message());
    }

    const auto local = acceptor.local_endpoint(ec);
    if (ec) {
        return Err<Ptr>(ErrorKind::Network, "failed to query listening port: " + ec.message());
    }

    auto provider = std::make_unique<Provider>(PrivateTag{}, io_context, std::move(acceptor), store, bus, node_id);
    provider->address_ = address;
    provider->port_ = local.port();
    return Ok(std::move(provider));
}

Provider::Provider(PrivateTag,
                   asio::io_context& io_context,
                   tcp::acceptor acceptor,
                   store::Store& store,
                   events::EventBus& bus,
                   const NodeId& node_id)
    : io_context_(io_context)
    , acceptor_(std::move(acceptor))
    , store_(store)
    , bus_(bus)
    , node_id_(node_id) {
}

void Provider::start() {
    spdlog::debug("Provider listening on {}:{}", address_, port_);
    bus_.emit(events::ProviderStartedEvent{address_, port_});
    do_accept();
}

void Provider::stop() {
    stopped_ = true;
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void Provider::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || stopped_) {
                return;
            }
            if (!ec) {
                std::make_shared<ProviderConnection>(
                    std::move(socket), store_, bus_, node_id_, ++next_connection_id_
                )->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        }
    );
}

std::vector<std::string> Provider::advertised_addresses() const {
    boost::system::error_code ec;
    const auto ip = asio::ip::make_address(address_, ec);
    if (!ec && !ip.is_unspecified()) {
        return {endpoint_string(tcp::endpoint(ip, port_))};
    }

    std::vector<std::string> addresses{endpoint_string(tcp::endpoint(asio::ip::address_v4::loopback(), port_))};

    const std::string host = asio::ip::host_name(ec);
    if (ec) {
        spdlog::debug("Cannot determine host name: {}", ec.message());
        return addresses;
    }

    tcp::resolver resolver(io_context_);
    const auto results = resolver.resolve(tcp::v4(), host, std::to_string(port_), ec);
    if (ec) {
        spdlog::debug("Cannot resolve {}: {}", host, ec.message());
        return addresses;
    }
    for (const auto& entry : results) {
        const auto address = entry.endpoint().address();
        if (address.is_loopback()) {
            continue;
        }
        auto text = endpoint_string(tcp::endpoint(address, port_));
        if (std::find(addresses.begin(), addresses.end(), text) == addresses.end()) {
            addresses.push_back(std::move(text));
        }
    }
    return addresses;
}

} // namespace sendme::net
