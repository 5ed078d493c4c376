#include "sendme/net/ticket.hpp"

#include "sendme/core/hex.hpp"

#include <charconv>

namespace sendme::net {

using json = nlohmann::json;

namespace {

Result<store::BlobFormat> format_from_name(const std::string& name) {
    if (name == store::format_name(store::BlobFormat::Raw)) {
        return Ok(store::BlobFormat::Raw);
    }
    if (name == store::format_name(store::BlobFormat::HashSeq)) {
        return Ok(store::BlobFormat::HashSeq);
    }
    return Err<store::BlobFormat>(ErrorKind::InvalidArgument, "ticket: unknown format '" + name + "'");
}

// json::value() throws on a type mismatch; a wrong type reads as empty here
std::string string_field(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

json Ticket::to_json() const {
    json j;
    j["addrs"] = addresses;
    j["node"] = node_id.to_hex();
    j["hash"] = content.hash.to_hex();
    j["format"] = store::format_name(content.format);
    return j;
}

Result<Ticket> Ticket::from_json(const json& j) {
    if (!j.is_object()) {
        return Err<Ticket>(ErrorKind::InvalidArgument, "ticket: expected a JSON object");
    }

    const auto addrs = j.find("addrs");
    if (addrs == j.end() || !addrs->is_array() || addrs->empty()) {
        return Err<Ticket>(ErrorKind::InvalidArgument, "ticket: missing addresses");
    }

    Ticket ticket;
    for (const auto& entry : *addrs) {
        if (!entry.is_string()) {
            return Err<Ticket>(ErrorKind::InvalidArgument, "ticket: address is not a string");
        }
        ticket.addresses.push_back(entry.get<std::string>());
    }

    auto node = store::Hash::from_hex(string_field(j, "node"));
    if (node.is_error()) {
        return Err<Ticket>(ErrorKind::InvalidArgument, "ticket: bad node id: " + node.error().message);
    }
    auto hash = store::Hash::from_hex(string_field(j, "hash"));
    if (hash.is_error()) {
        return Err<Ticket>(ErrorKind::InvalidArgument, "ticket: bad hash: " + hash.error().message);
    }
    auto format = format_from_name(string_field(j, "format"));
    if (format.is_error()) {
        return Err<Ticket>(format.error());
    }

    ticket.node_id = node.value();
    ticket.content = store::HashAndFormat{hash.value(), format.value()};
    return Ok(std::move(ticket));
}

std::string Ticket::to_string() const {
    return std::string(kPrefix) + hex::encode(to_json().dump());
}

Result<Ticket> Ticket::parse(std::string_view text) {
    if (text.substr(0, kPrefix.size()) != kPrefix) {
        return Err<Ticket>(ErrorKind::InvalidArgument, "ticket must start with '" + std::string(kPrefix) + "'");
    }

    auto bytes = hex::decode(text.substr(kPrefix.size()));
    if (bytes.is_error()) {
        return Err<Ticket>(ErrorKind::InvalidArgument, "ticket: " + bytes.error().message);
    }

    // parse without exceptions; a discarded value marks malformed input
    json j = json::parse(bytes.value().begin(), bytes.value().end(), nullptr, false);
    if (j.is_discarded()) {
        return Err<Ticket>(ErrorKind::InvalidArgument, "ticket: payload is not valid JSON");
    }
    return from_json(j);
}

Result<std::pair<std::string, std::uint16_t>> split_host_port(std::string_view address) {
    using Pair = std::pair<std::string, std::uint16_t>;

    const auto colon = address.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == address.size()) {
        return Err<Pair>(ErrorKind::InvalidArgument, "address '" + std::string(address) + "' is not host:port");
    }

    std::string_view host = address.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    const std::string_view port_text = address.substr(colon + 1);
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0 || port > 65535) {
        return Err<Pair>(ErrorKind::InvalidArgument, "invalid port in address '" + std::string(address) + "'");
    }
    return Ok(Pair{std::string(host), static_cast<std::uint16_t>(port)});
}

} // namespace sendme::net
