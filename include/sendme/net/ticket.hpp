#pragma once

#include "sendme/core/result.hpp"
#include "sendme/net/secret_key.hpp"
#include "sendme/store/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace sendme::net {

/**
 * @brief Everything a getter needs to fetch a collection
 *
 * TEXT FORM:
 * "sendme" + lowercase hex of the compact JSON object
 *   {"addrs": ["host:port", ...], "node": "<hex>", "hash": "<hex>", "format": "raw"|"hash_seq"}
 */
struct Ticket {
    static constexpr std::string_view kPrefix = "sendme";

    std::vector<std::string> addresses;
    NodeId node_id;
    store::HashAndFormat content;

    [[nodiscard]] nlohmann::json to_json() const;
    static Result<Ticket> from_json(const nlohmann::json& j);

    [[nodiscard]] std::string to_string() const;
    static Result<Ticket> parse(std::string_view text);

    bool operator==(const Ticket& other) const {
        return addresses == other.addresses && node_id == other.node_id && content == other.content;
    }
};

/**
 * Split "host:port" at the last colon. IPv6 hosts may be bracketed.
 */
Result<std::pair<std::string, std::uint16_t>> split_host_port(std::string_view address);

} // namespace sendme::net
