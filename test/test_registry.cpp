#include <doctest/doctest.h>
#include <parley/server/registry.hpp>

namespace {

    struct FakePeer {
        std::string name;
    };

} // namespace

TEST_CASE("PeerRegistry") {
    parley::PeerRegistry<FakePeer> registry;
    auto alice = std::make_shared<FakePeer>(FakePeer{"alice"});
    auto bob = std::make_shared<FakePeer>(FakePeer{"bob"});

    REQUIRE(registry.add("127.0.0.1:1000", alice).is_ok());
    REQUIRE(registry.add("127.0.0.1:2000", bob).is_ok());
    CHECK(registry.size() == 2);

    SUBCASE("Identifier can only be taken once") {
        auto impostor = std::make_shared<FakePeer>(FakePeer{"mallory"});
        CHECK(registry.add("127.0.0.1:1000", impostor).is_err());
        CHECK(registry.find("127.0.0.1:1000")->name == "alice");
    }

    SUBCASE("Find and contains") {
        CHECK(registry.contains("127.0.0.1:2000"));
        CHECK_FALSE(registry.contains("127.0.0.1:3000"));
        CHECK(registry.find("127.0.0.1:3000") == nullptr);
    }

    SUBCASE("Remove returns the peer once") {
        auto removed = registry.remove("127.0.0.1:1000");
        REQUIRE(removed);
        CHECK(removed->name == "alice");
        CHECK(registry.remove("127.0.0.1:1000") == nullptr);
        CHECK(registry.size() == 1);
    }

    SUBCASE("remove_if_same leaves a newer entry alone") {
        registry.remove("127.0.0.1:1000");
        auto returning = std::make_shared<FakePeer>(FakePeer{"alice again"});
        REQUIRE(registry.add("127.0.0.1:1000", returning).is_ok());

        CHECK_FALSE(registry.remove_if_same("127.0.0.1:1000", alice.get()));
        CHECK(registry.contains("127.0.0.1:1000"));
        CHECK(registry.remove_if_same("127.0.0.1:1000", returning.get()));
        CHECK_FALSE(registry.contains("127.0.0.1:1000"));
    }

    SUBCASE("Snapshot and drain") {
        CHECK(registry.snapshot().size() == 2);
        auto drained = registry.drain();
        CHECK(drained.size() == 2);
        CHECK(registry.size() == 0);
        CHECK(registry.snapshot().empty());
    }
}
