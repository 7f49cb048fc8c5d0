#include <doctest/doctest.h>
#include <parley/protocol/codec.hpp>
#include <parley/stream/framer.hpp>

TEST_CASE("frame") {
    parley::Bytes payload = {0x01, 0x02, 0x03};
    auto wire = parley::frame(payload);
    REQUIRE(wire.size() == 7);
    CHECK(wire[0] == 0x00);
    CHECK(wire[3] == 0x03);
    CHECK(wire[4] == 0x01);
    CHECK(wire[6] == 0x03);
}

TEST_CASE("FrameAssembler - whole frames") {
    parley::FrameAssembler assembler;

    SUBCASE("One frame in one chunk") {
        auto res = assembler.feed(parley::frame(parley::to_bytes("hello")));
        REQUIRE(res.is_ok());
        CHECK(res.value() == 1);
        REQUIRE(assembler.has_frame());
        CHECK(parley::to_text(assembler.pop_frame()) == "hello");
        CHECK_FALSE(assembler.has_frame());
        CHECK(assembler.state() == parley::FrameAssembler::State::AwaitingLength);
    }

    SUBCASE("Several frames in one chunk") {
        parley::Bytes chunk;
        for (const char *text : {"one", "two", "three"}) {
            auto wire = parley::frame(parley::to_bytes(text));
            chunk.insert(chunk.end(), wire.begin(), wire.end());
        }
        auto res = assembler.feed(chunk);
        REQUIRE(res.is_ok());
        CHECK(res.value() == 3);
        CHECK(parley::to_text(assembler.pop_frame()) == "one");
        CHECK(parley::to_text(assembler.pop_frame()) == "two");
        CHECK(parley::to_text(assembler.pop_frame()) == "three");
    }

    SUBCASE("Empty frame") {
        auto res = assembler.feed(parley::frame(parley::Bytes()));
        REQUIRE(res.is_ok());
        CHECK(res.value() == 1);
        CHECK(assembler.pop_frame().empty());
    }

    SUBCASE("Empty chunk completes nothing") {
        auto res = assembler.feed(nullptr, 0);
        REQUIRE(res.is_ok());
        CHECK(res.value() == 0);
    }
}

TEST_CASE("FrameAssembler - split frames") {
    SUBCASE("One byte at a time yields the original messages") {
        dp::Vector<parley::Message> sent;
        sent.push_back(parley::make_chat("hello", "alice"));
        sent.push_back(parley::make_status("Welcome to the chat server, alice!"));
        sent.push_back(parley::make_test("alice"));

        parley::Bytes stream;
        for (const auto &msg : sent) {
            auto wire = parley::frame(parley::encode(msg));
            stream.insert(stream.end(), wire.begin(), wire.end());
        }

        parley::FrameAssembler assembler;
        dp::Vector<parley::Message> received;
        for (dp::u8 byte : stream) {
            auto res = assembler.feed(&byte, 1);
            REQUIRE(res.is_ok());
            while (assembler.has_frame()) {
                auto decoded = parley::decode(assembler.pop_frame());
                REQUIRE(decoded.is_ok());
                received.push_back(decoded.value());
            }
        }

        REQUIRE(received.size() == sent.size());
        for (dp::usize i = 0; i < sent.size(); i++) {
            CHECK(received[i] == sent[i]);
        }
    }

    SUBCASE("Split inside the length header") {
        parley::FrameAssembler assembler;
        auto wire = parley::frame(parley::to_bytes("abc"));

        auto first = assembler.feed(wire.data(), 2);
        REQUIRE(first.is_ok());
        CHECK(first.value() == 0);
        CHECK(assembler.state() == parley::FrameAssembler::State::AwaitingLength);
        CHECK(assembler.buffered() == 2);

        auto second = assembler.feed(wire.data() + 2, 3);
        REQUIRE(second.is_ok());
        CHECK(second.value() == 0);
        CHECK(assembler.state() == parley::FrameAssembler::State::AwaitingBody);

        auto third = assembler.feed(wire.data() + 5, wire.size() - 5);
        REQUIRE(third.is_ok());
        CHECK(third.value() == 1);
        CHECK(parley::to_text(assembler.pop_frame()) == "abc");
    }

    SUBCASE("Frame completed together with the start of the next") {
        parley::FrameAssembler assembler;
        auto a = parley::frame(parley::to_bytes("first"));
        auto b = parley::frame(parley::to_bytes("second"));
        parley::Bytes chunk = a;
        chunk.insert(chunk.end(), b.begin(), b.begin() + 6);

        auto res = assembler.feed(chunk);
        REQUIRE(res.is_ok());
        CHECK(res.value() == 1);
        CHECK(assembler.buffered() == 6);

        auto rest = assembler.feed(b.data() + 6, b.size() - 6);
        REQUIRE(rest.is_ok());
        CHECK(rest.value() == 1);
        CHECK(parley::to_text(assembler.pop_frame()) == "first");
        CHECK(parley::to_text(assembler.pop_frame()) == "second");
    }
}

TEST_CASE("FrameAssembler - size limit") {
    SUBCASE("Header above 1 MiB is rejected") {
        parley::FrameAssembler assembler;
        parley::Bytes header;
        parley::append_u32_be(header, parley::MAX_FRAME_SIZE + 1);

        auto res = assembler.feed(header);
        REQUIRE(res.is_err());
        CHECK(parley::to_std(res.error().message) == "frame too large");
        CHECK(assembler.failed());

        // Out of sync for good
        auto again = assembler.feed(parley::frame(parley::to_bytes("ok")));
        CHECK(again.is_err());
    }

    SUBCASE("Exactly 1 MiB is accepted") {
        parley::FrameAssembler assembler;
        parley::Bytes payload(parley::MAX_FRAME_SIZE, 0x5A);
        auto res = assembler.feed(parley::frame(payload));
        REQUIRE(res.is_ok());
        CHECK(res.value() == 1);
        CHECK(assembler.pop_frame().size() == parley::MAX_FRAME_SIZE);
    }

    SUBCASE("Custom limit") {
        parley::FrameAssembler assembler(8);
        CHECK(assembler.feed(parley::frame(parley::to_bytes("12345678"))).is_ok());
        CHECK(assembler.feed(parley::frame(parley::to_bytes("123456789"))).is_err());
    }

    SUBCASE("Reset clears the failure") {
        parley::FrameAssembler assembler(4);
        CHECK(assembler.feed(parley::frame(parley::to_bytes("too long"))).is_err());
        assembler.reset();
        CHECK_FALSE(assembler.failed());
        CHECK(assembler.feed(parley::frame(parley::to_bytes("ok"))).is_ok());
    }
}
