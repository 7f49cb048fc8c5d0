#pragma once

#include <nlohmann/json.hpp>
#include <parley/protocol/message.hpp>

namespace parley {

    /// Reliable datagram envelope nested in a Chat message's content
    /// {"sequence":<int>,"data":"<string>","test_id":"<string>"|null}
    struct Envelope {
        dp::u64 sequence = 0;
        std::string data;
        std::string test_id; // empty encodes as null
    };

    /// Acknowledgement content
    /// {"sequence":<int>,"test_id":"<string>"|null}
    struct AckInfo {
        dp::u64 sequence = 0;
        std::string test_id;
    };

    namespace detail {
        inline void put_test_id(nlohmann::json &j, const std::string &test_id) {
            if (test_id.empty()) {
                j["test_id"] = nullptr;
            } else {
                j["test_id"] = test_id;
            }
        }

        inline std::string get_test_id(const nlohmann::json &j) {
            auto it = j.find("test_id");
            if (it != j.end() && it->is_string()) {
                return it->get<std::string>();
            }
            return std::string();
        }

        inline dp::Res<nlohmann::json> parse_object(const std::string &content) {
            auto j = nlohmann::json::parse(content, nullptr, false);
            if (j.is_discarded() || !j.is_object()) {
                return dp::result::err(dp::Error::invalid_argument("not a JSON object"));
            }
            auto seq = j.find("sequence");
            if (seq == j.end() || !seq->is_number_unsigned()) {
                return dp::result::err(dp::Error::invalid_argument("missing sequence"));
            }
            return dp::result::ok(std::move(j));
        }
    } // namespace detail

    inline std::string encode_envelope(const Envelope &env) {
        nlohmann::json j;
        j["sequence"] = env.sequence;
        j["data"] = env.data;
        detail::put_test_id(j, env.test_id);
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    /// Decode a Chat content as an envelope; plain text is an error
    inline dp::Res<Envelope> decode_envelope(const std::string &content) {
        auto obj_res = detail::parse_object(content);
        if (obj_res.is_err()) {
            return dp::result::err(obj_res.error());
        }
        const auto &j = obj_res.value();

        auto data_it = j.find("data");
        if (data_it == j.end() || !data_it->is_string()) {
            return dp::result::err(dp::Error::invalid_argument("missing data"));
        }

        Envelope env;
        env.sequence = j["sequence"].get<dp::u64>();
        env.data = data_it->get<std::string>();
        env.test_id = detail::get_test_id(j);
        return dp::result::ok(std::move(env));
    }

    inline std::string encode_ack(const AckInfo &ack) {
        nlohmann::json j;
        j["sequence"] = ack.sequence;
        detail::put_test_id(j, ack.test_id);
        return j.dump();
    }

    inline dp::Res<AckInfo> decode_ack(const std::string &content) {
        auto obj_res = detail::parse_object(content);
        if (obj_res.is_err()) {
            return dp::result::err(obj_res.error());
        }
        const auto &j = obj_res.value();

        AckInfo ack;
        ack.sequence = j["sequence"].get<dp::u64>();
        ack.test_id = detail::get_test_id(j);
        return dp::result::ok(std::move(ack));
    }

    inline Message make_ack(const AckInfo &ack, const std::string &sender) {
        return make_message(MessageKind::Ack, encode_ack(ack), sender);
    }

} // namespace parley
