#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <parley/common.hpp>

TEST_CASE("encode_u32_be") {
    auto bytes = parley::encode_u32_be(0x12345678);
    CHECK(bytes[0] == 0x12);
    CHECK(bytes[1] == 0x34);
    CHECK(bytes[2] == 0x56);
    CHECK(bytes[3] == 0x78);
}

TEST_CASE("decode_u32_be") {
    dp::Array<dp::u8, 4> bytes = {0x00, 0x10, 0x00, 0x00};
    auto value = parley::decode_u32_be(bytes.data());
    CHECK(value == parley::MAX_FRAME_SIZE);
}

TEST_CASE("append_u32_be") {
    parley::Bytes buffer = {0xFF};
    parley::append_u32_be(buffer, 5);
    REQUIRE(buffer.size() == 5);
    CHECK(buffer[0] == 0xFF);
    CHECK(buffer[1] == 0x00);
    CHECK(buffer[4] == 0x05);
}

TEST_CASE("Text and byte conversions") {
    auto bytes = parley::to_bytes("hi!");
    REQUIRE(bytes.size() == 3);
    CHECK(bytes[0] == 'h');
    CHECK(parley::to_text(bytes) == "hi!");
    CHECK(parley::to_std(dp::String("127.0.0.1:5050")) == "127.0.0.1:5050");
}

TEST_CASE("socket_error categories") {
    CHECK(parley::socket_error("read", EAGAIN).code == dp::Error::TIMEOUT);

    auto reset = parley::socket_error("read", ECONNRESET);
    CHECK(reset.code != dp::Error::TIMEOUT);
    CHECK(parley::to_std(reset.message) == "connection reset by peer");

    auto pipe = parley::socket_error("write", EPIPE);
    CHECK(parley::to_std(pipe.message) == "broken pipe");

    auto other = parley::socket_error("read", ENOMEM);
    CHECK(other.code != dp::Error::TIMEOUT);
    CHECK(parley::to_std(other.message).find("read error") == 0);
}
