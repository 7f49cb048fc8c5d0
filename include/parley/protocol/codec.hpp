#pragma once

#include <nlohmann/json.hpp>
#include <parley/protocol/message.hpp>

#include <algorithm>

namespace parley {

    /// Wire format (one JSON object per message):
    /// {"type":"<kind>","content":"...","username":"..."|null,"timestamp":<float>,"version":"1.0"}

    /// Encode a message into its textual payload
    inline Bytes encode(MessageKind kind, const std::string &content, const std::string &sender, double timestamp,
                        const std::string &version) {
        nlohmann::json j;
        j["type"] = kind_name(kind);
        j["content"] = content;
        if (sender.empty()) {
            j["username"] = nullptr;
        } else {
            j["username"] = sender;
        }
        j["timestamp"] = timestamp;
        j["version"] = version;

        // Replace invalid UTF-8 instead of throwing
        auto text = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        echo::trace("encode ", kind_name(kind), " len=", text.size());
        return to_bytes(text);
    }

    inline Bytes encode(const Message &msg) {
        return encode(msg.kind, msg.content, msg.sender, msg.timestamp, msg.version);
    }

    /// Decode a textual payload
    /// Leading bytes before the first '{' are skipped; missing or mistyped required
    /// fields and unknown kinds are rejected
    inline dp::Res<Message> decode(const dp::u8 *data, dp::usize size) {
        const dp::u8 *end = data + size;
        const dp::u8 *start = std::find(data, end, static_cast<dp::u8>('{'));
        if (start == end) {
            echo::warn("decode: no payload object in ", size, " bytes");
            return dp::result::err(dp::Error::invalid_argument("malformed message: no JSON object"));
        }
        if (start != data) {
            echo::debug("decode: skipped ", static_cast<dp::usize>(start - data), " leading bytes");
        }

        auto j = nlohmann::json::parse(start, end, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            echo::warn("decode: invalid JSON");
            return dp::result::err(dp::Error::invalid_argument("malformed message: invalid JSON"));
        }

        auto type_it = j.find("type");
        auto content_it = j.find("content");
        auto timestamp_it = j.find("timestamp");
        if (type_it == j.end() || content_it == j.end() || timestamp_it == j.end()) {
            echo::warn("decode: missing required field");
            return dp::result::err(dp::Error::invalid_argument("malformed message: missing required field"));
        }
        if (!type_it->is_string() || !content_it->is_string() || !timestamp_it->is_number()) {
            echo::warn("decode: required field has wrong type");
            return dp::result::err(dp::Error::invalid_argument("malformed message: wrong field type"));
        }

        auto kind_res = parse_kind(type_it->get<std::string>());
        if (kind_res.is_err()) {
            return dp::result::err(kind_res.error());
        }

        Message msg;
        msg.kind = kind_res.value();
        msg.content = content_it->get<std::string>();
        msg.timestamp = timestamp_it->get<double>();

        auto username_it = j.find("username");
        if (username_it != j.end() && !username_it->is_null()) {
            if (!username_it->is_string()) {
                echo::warn("decode: username has wrong type");
                return dp::result::err(dp::Error::invalid_argument("malformed message: wrong field type"));
            }
            msg.sender = username_it->get<std::string>();
        }

        auto version_it = j.find("version");
        if (version_it != j.end() && version_it->is_string()) {
            msg.version = version_it->get<std::string>();
        }

        echo::trace("decode ", kind_name(msg.kind), " from '", msg.sender.c_str(), "'");
        return dp::result::ok(std::move(msg));
    }

    inline dp::Res<Message> decode(const Bytes &payload) { return decode(payload.data(), payload.size()); }

} // namespace parley
