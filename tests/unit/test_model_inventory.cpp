#include <catch2/catch.hpp>

#include "ModelInventory.hpp"
#include "TestHelpers.hpp"

namespace {

struct InventoryFixture {
    InventoryFixture()
        : inventory(backend, std::chrono::seconds(60), [this] { return now; })
    {
    }

    FakeBackend backend;
    ModelInventory::Clock::time_point now{};
    ModelInventory inventory;
};

} // namespace

TEST_CASE("ModelInventory serves a fresh snapshot without refetching") {
    InventoryFixture fx;
    fx.backend.models = {"llama3", "llava"};

    REQUIRE(fx.inventory.models() == std::vector<std::string>{"llama3", "llava"});
    fx.now += std::chrono::seconds(59);
    REQUIRE(fx.inventory.models().size() == 2);
    REQUIRE(fx.backend.list_calls == 1);
}

TEST_CASE("ModelInventory refreshes once the TTL expires") {
    InventoryFixture fx;
    fx.backend.models = {"llama3"};
    REQUIRE(fx.inventory.models().size() == 1);

    fx.backend.models = {"llama3", "qwen-coder"};
    fx.now += std::chrono::seconds(60);
    REQUIRE(fx.inventory.models().size() == 2);
    REQUIRE(fx.backend.list_calls == 2);
}

TEST_CASE("ModelInventory keeps the last good snapshot when a refresh fails") {
    InventoryFixture fx;
    fx.backend.models = {"llama3"};
    REQUIRE(fx.inventory.models().size() == 1);

    fx.backend.fail_listing = true;
    fx.now += std::chrono::seconds(120);
    REQUIRE(fx.inventory.models() == std::vector<std::string>{"llama3"});
}

TEST_CASE("ModelInventory returns an empty list before any successful fetch") {
    InventoryFixture fx;
    fx.backend.fail_listing = true;

    REQUIRE(fx.inventory.models().empty());
    REQUIRE_FALSE(fx.inventory.fetched_at().has_value());
}

TEST_CASE("ModelInventory refetches an empty snapshot and after invalidate") {
    InventoryFixture fx;
    REQUIRE(fx.inventory.models().empty());
    REQUIRE(fx.inventory.models().empty());
    REQUIRE(fx.backend.list_calls == 2);

    fx.backend.models = {"phi3"};
    REQUIRE(fx.inventory.models().size() == 1);
    fx.inventory.invalidate();
    REQUIRE(fx.inventory.models().size() == 1);
    REQUIRE(fx.backend.list_calls == 4);
}
