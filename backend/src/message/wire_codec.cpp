/**
 * WireCodec — Length-prefixed MessagePack envelopes.
 *
 * The envelope is built with nlohmann::json and serialized with its
 * MessagePack backend. Decoding never throws: malformed input yields
 * std::nullopt and the caller decides what to do with it.
 */

#include "message/wire_codec.h"

#include <limits>
#include <string>
#include <type_traits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr const char* kAddRequest  = "add_request";
constexpr const char* kAddResponse = "add_response";
constexpr const char* kEchoMessage = "echo_message";

WireCodec::Bytes frame(const json& envelope) {
    const WireCodec::Bytes payload = json::to_msgpack(envelope);
    const auto size = static_cast<std::uint32_t>(payload.size());

    WireCodec::Bytes out;
    out.reserve(WireCodec::kHeaderSize + payload.size());
    out.push_back(static_cast<std::uint8_t>(size >> 24));
    out.push_back(static_cast<std::uint8_t>(size >> 16));
    out.push_back(static_cast<std::uint8_t>(size >> 8));
    out.push_back(static_cast<std::uint8_t>(size));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

/// Read `body[key]` as an int32. Fails on missing keys, non-integers and
/// values outside the int32 range.
bool read_int32(const json& body, const char* key, std::int32_t& out) {
    const auto it = body.find(key);
    if (it == body.end() || !it->is_number_integer()) return false;

    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) return false;
        out = static_cast<std::int32_t>(value);
        return true;
    }

    const auto value = it->get<std::int64_t>();
    if (value < std::numeric_limits<std::int32_t>::min() ||
        value > std::numeric_limits<std::int32_t>::max()) {
        return false;
    }
    out = static_cast<std::int32_t>(value);
    return true;
}

bool read_string(const json& body, const char* key, std::string& out) {
    const auto it = body.find(key);
    if (it == body.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

/**
 * SAX pass that only tracks nesting. The MessagePack reader recurses once
 * per array or map, so a payload of nested containers is refused here
 * before the DOM parser gets to see it.
 */
class DepthLimit {
public:
    using number_integer_t = json::number_integer_t;
    using number_unsigned_t = json::number_unsigned_t;
    using number_float_t = json::number_float_t;
    using string_t = json::string_t;
    using binary_t = json::binary_t;

    bool null() { return true; }
    bool boolean(bool) { return true; }
    bool number_integer(number_integer_t) { return true; }
    bool number_unsigned(number_unsigned_t) { return true; }
    bool number_float(number_float_t, const string_t&) { return true; }
    bool string(string_t&) { return true; }
    bool binary(binary_t&) { return true; }
    bool key(string_t&) { return true; }

    bool start_object(std::size_t) { return enter(); }
    bool end_object() { return leave(); }
    bool start_array(std::size_t) { return enter(); }
    bool end_array() { return leave(); }

    bool parse_error(std::size_t, const std::string&, const json::exception&) { return false; }

private:
    bool enter() { return ++depth_ <= WireCodec::kMaxDepth; }
    bool leave() {
        --depth_;
        return true;
    }

    std::size_t depth_ = 0;
};

/// Parse a payload into an object envelope, or a discarded value.
json parse_envelope(const WireCodec::Bytes& payload) {
    DepthLimit depth_limit;
    if (!json::sax_parse(payload, &depth_limit, json::input_format_t::msgpack, /*strict=*/true)) {
        return json(json::value_t::discarded);
    }

    json envelope = json::from_msgpack(payload, /*strict=*/true, /*allow_exceptions=*/false);
    if (!envelope.is_object()) return json(json::value_t::discarded);
    return envelope;
}

std::optional<EchoMessage> read_echo(const json& body) {
    EchoMessage echo;
    if (!body.is_object() || !read_string(body, "content", echo.content)) return std::nullopt;
    return echo;
}

} // namespace

WireCodec::Bytes WireCodec::encode(const ClientMessage& message) {
    json envelope = json::object();
    std::visit([&envelope](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AddRequest>) {
            envelope[kAddRequest] = {{"a", m.a}, {"b", m.b}};
        } else if constexpr (std::is_same_v<T, EchoMessage>) {
            envelope[kEchoMessage] = {{"content", m.content}};
        }
    }, message);
    return frame(envelope);
}

WireCodec::Bytes WireCodec::encode(const ServerMessage& message) {
    json envelope = json::object();
    std::visit([&envelope](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AddResponse>) {
            envelope[kAddResponse] = {{"result", m.result}};
        } else {
            envelope[kEchoMessage] = {{"content", m.content}};
        }
    }, message);
    return frame(envelope);
}

std::optional<ClientMessage> WireCodec::decode_client(const Bytes& payload) {
    const json envelope = parse_envelope(payload);
    if (envelope.is_discarded()) return std::nullopt;

    if (const auto it = envelope.find(kAddRequest); it != envelope.end()) {
        AddRequest request;
        if (!it->is_object() ||
            !read_int32(*it, "a", request.a) ||
            !read_int32(*it, "b", request.b)) {
            return std::nullopt;
        }
        return ClientMessage{request};
    }

    if (const auto it = envelope.find(kEchoMessage); it != envelope.end()) {
        auto echo = read_echo(*it);
        if (!echo) return std::nullopt;
        return ClientMessage{std::move(*echo)};
    }

    return ClientMessage{std::monostate{}};
}

std::optional<ServerMessage> WireCodec::decode_server(const Bytes& payload) {
    const json envelope = parse_envelope(payload);
    if (envelope.is_discarded()) return std::nullopt;

    if (const auto it = envelope.find(kAddResponse); it != envelope.end()) {
        AddResponse response;
        if (!it->is_object() || !read_int32(*it, "result", response.result)) return std::nullopt;
        return ServerMessage{response};
    }

    if (const auto it = envelope.find(kEchoMessage); it != envelope.end()) {
        auto echo = read_echo(*it);
        if (!echo) return std::nullopt;
        return ServerMessage{std::move(*echo)};
    }

    return std::nullopt;
}

std::optional<std::size_t> WireCodec::read_header(const std::uint8_t* header) {
    const std::size_t size = (static_cast<std::size_t>(header[0]) << 24) |
                             (static_cast<std::size_t>(header[1]) << 16) |
                             (static_cast<std::size_t>(header[2]) << 8) |
                             static_cast<std::size_t>(header[3]);
    if (size > kMaxFrameSize) return std::nullopt;
    return size;
}

std::vector<WireCodec::Bytes> WireCodec::split_frames(const std::uint8_t* data, std::size_t size) {
    std::vector<Bytes> frames;
    std::size_t offset = 0;

    while (size - offset >= kHeaderSize) {
        const auto length = read_header(data + offset);
        if (!length || size - offset - kHeaderSize < *length) break;

        const std::uint8_t* begin = data + offset + kHeaderSize;
        frames.emplace_back(begin, begin + *length);
        offset += kHeaderSize + *length;
    }
    return frames;
}
