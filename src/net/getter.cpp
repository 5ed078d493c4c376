#include "sendme/net/getter.hpp"

#include "sendme/core/wire.hpp"
#include "sendme/store/hash_seq.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace sendme::net {

Result<std::unique_ptr<Getter>> Getter::connect(asio::io_context& io_context, const Ticket& ticket) {
    using Ptr = std::unique_ptr<Getter>;

    if (ticket.addresses.empty()) {
        return Err<Ptr>(ErrorKind::InvalidArgument, "ticket has no addresses");
    }

    std::string last_error;
    for (const auto& address : ticket.addresses) {
        auto host_port = split_host_port(address);
        if (host_port.is_error()) {
            last_error = host_port.error().message;
            continue;
        }
        const auto& [host, port] = host_port.value();

        boost::system::error_code ec;
        tcp::resolver resolver(io_context);
        const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            last_error = address + ": " + ec.message();
            continue;
        }

        tcp::socket socket(io_context);
        asio::connect(socket, endpoints, ec);
        if (ec) {
            last_error = address + ": " + ec.message();
            spdlog::debug("Connect to {} failed: {}", address, ec.message());
            continue;
        }

        std::vector<std::uint8_t> hello(kHelloSize);
        asio::read(socket, asio::buffer(hello), ec);
        if (ec) {
            return Err<Ptr>(ErrorKind::Network, "no hello from " + address + ": " + ec.message());
        }
        auto node_id = decode_hello(hello);
        if (node_id.is_error()) {
            return Err<Ptr>(node_id.error());
        }
        if (node_id.value() != ticket.node_id) {
            return Err<Ptr>(ErrorKind::ProtocolViolation,
                            "provider at " + address + " is " + node_id.value().to_hex() +
                            ", ticket expects " + ticket.node_id.to_hex());
        }

        spdlog::debug("Connected to {} ({})", address, ticket.node_id.to_hex());
        return Ok(std::make_unique<Getter>(PrivateTag{}, std::move(socket), ticket.content, address));
    }

    return Err<Ptr>(ErrorKind::Network, "could not reach provider: " + last_error);
}

Getter::Getter(PrivateTag, tcp::socket socket, store::HashAndFormat content, std::string remote)
    : socket_(std::move(socket))
    , content_(content)
    , remote_(std::move(remote)) {
}

Getter::~Getter() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

Result<void> Getter::read_exact(std::uint8_t* data, std::size_t size) {
    boost::system::error_code ec;
    asio::read(socket_, asio::buffer(data, size), ec);
    if (ec == asio::error::eof) {
        return Err<void>(ErrorKind::Network, "provider closed the connection");
    }
    if (ec) {
        return Err<void>(ErrorKind::Network, "read from " + remote_ + " failed: " + ec.message());
    }
    return Ok();
}

Result<void> Getter::send_request(RequestKind kind) {
    const auto data = encode_request(Request{kind, content_});
    boost::system::error_code ec;
    asio::write(socket_, asio::buffer(data), ec);
    if (ec) {
        return Err<void>(ErrorKind::Network, "write to " + remote_ + " failed: " + ec.message());
    }
    return Ok();
}

Result<void> Getter::expect_ok() {
    std::uint8_t byte = 0;
    auto read = read_exact(&byte, 1);
    if (read.is_error()) {
        return read;
    }
    auto status = decode_status(byte);
    if (status.is_error()) {
        return Err<void>(status.error());
    }
    switch (status.value()) {
        case ResponseStatus::Ok:
            return Ok();
        case ResponseStatus::NotFound:
            return Err<void>(ErrorKind::NotFound, "provider does not have " + content_.hash.to_hex());
        case ResponseStatus::BadRequest:
            break;
    }
    return Err<void>(ErrorKind::ProtocolViolation, "provider rejected the request");
}

Result<std::uint64_t> Getter::read_frame_header() {
    std::vector<std::uint8_t> header(kFrameHeaderSize);
    auto read = read_exact(header.data(), header.size());
    if (read.is_error()) {
        return Err<std::uint64_t>(read.error());
    }
    std::size_t cursor = 0;
    return wire::read_uint64(header, cursor);
}

Result<std::vector<std::uint64_t>> Getter::fetch_sizes() {
    using Sizes = std::vector<std::uint64_t>;

    auto sent = send_request(RequestKind::Sizes);
    if (sent.is_error()) {
        return Err<Sizes>(sent.error());
    }
    auto ok = expect_ok();
    if (ok.is_error()) {
        return Err<Sizes>(ok.error());
    }

    std::vector<std::uint8_t> count_bytes(4);
    auto read = read_exact(count_bytes.data(), count_bytes.size());
    if (read.is_error()) {
        return Err<Sizes>(read.error());
    }
    std::size_t cursor = 0;
    const std::uint32_t count = wire::read_uint32(count_bytes, cursor).value();
    if (count > kMaxSizesCount) {
        return Err<Sizes>(ErrorKind::ProtocolViolation, "sizes reply lists too many blobs");
    }

    std::vector<std::uint8_t> body(static_cast<std::size_t>(count) * 8);
    read = read_exact(body.data(), body.size());
    if (read.is_error()) {
        return Err<Sizes>(read.error());
    }

    Sizes sizes;
    sizes.reserve(count);
    cursor = 0;
    for (std::uint32_t i = 0; i < count; ++i) {
        sizes.push_back(wire::read_uint64(body, cursor).value());
    }
    return Ok(std::move(sizes));
}

Result<store::TempTag> Getter::fetch(store::Store& store, TransferFeed& feed) {
    auto result = download(store, feed);
    if (result.is_error()) {
        feed.push(get::Aborted{result.error().message});
    }
    feed.close();
    return result;
}

Result<store::TempTag> Getter::download(store::Store& store, TransferFeed& feed) {
    using Tag = store::TempTag;

    feed.push(get::Connected{});

    auto sent = send_request(RequestKind::Get);
    if (sent.is_error()) {
        return Err<Tag>(sent.error());
    }
    const auto started = std::chrono::steady_clock::now();
    payload_received_ = 0;
    feed.push(get::RequestSent{});

    auto ok = expect_ok();
    if (ok.is_error()) {
        return Err<Tag>(ok.error());
    }

    Tag root_tag;
    if (content_.format == store::BlobFormat::Raw) {
        auto item = receive_item(store, feed, content_.hash, 0);
        if (item.is_error()) {
            return item;
        }
        root_tag = std::move(item.value());
    } else {
        auto root_size = read_frame_header();
        if (root_size.is_error()) {
            return Err<Tag>(root_size.error());
        }
        if (root_size.value() > kMaxHashSeqSize) {
            return Err<Tag>(ErrorKind::ProtocolViolation, "hash sequence root is too large");
        }

        std::vector<std::uint8_t> root(static_cast<std::size_t>(root_size.value()));
        auto read = read_exact(root.data(), root.size());
        if (read.is_error()) {
            return Err<Tag>(read.error());
        }
        if (store::Hash::of(root) != content_.hash) {
            return Err<Tag>(ErrorKind::Corrupt, "hash sequence root does not match the ticket");
        }
        auto children = store::parse_hash_seq(root);
        if (children.is_error()) {
            return Err<Tag>(children.error());
        }
        auto tag = store.import_bytes(root, store::BlobFormat::HashSeq);
        if (tag.is_error()) {
            return tag;
        }
        root_tag = std::move(tag.value());
        payload_received_ += root.size();

        feed.push(get::CollectionDiscovered{children.value().size()});

        for (std::size_t i = 0; i < children.value().size(); ++i) {
            auto item = receive_item(store, feed, children.value()[i], i);
            if (item.is_error()) {
                return item;
            }
        }
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    feed.push(get::TransferDone{
        payload_received_,
        std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed)});
    return Ok(std::move(root_tag));
}

Result<store::TempTag> Getter::receive_item(store::Store& store,
                                            TransferFeed& feed,
                                            const store::Hash& expected,
                                            std::uint64_t index) {
    using Tag = store::TempTag;

    auto size = read_frame_header();
    if (size.is_error()) {
        return Err<Tag>(size.error());
    }
    feed.push(get::ItemStarted{index, size.value()});

    auto writer = store.begin_write();
    if (writer.is_error()) {
        return Err<Tag>(writer.error());
    }

    std::vector<std::uint8_t> chunk(kChunkSize);
    std::uint64_t received = 0;
    while (received < size.value()) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(size.value() - received, chunk.size()));
        auto read = read_exact(chunk.data(), want);
        if (read.is_error()) {
            return Err<Tag>(read.error());
        }
        auto written = writer.value()->write(chunk.data(), want);
        if (written.is_error()) {
            return Err<Tag>(written.error());
        }
        received += want;
        payload_received_ += want;
        feed.push(get::ItemProgress{index, received});
    }

    auto tag = writer.value()->commit(expected, store::BlobFormat::Raw);
    if (tag.is_error()) {
        return tag;
    }
    feed.push(get::ItemDone{index});
    return tag;
}

} // namespace sendme::net
