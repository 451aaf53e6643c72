#include <doctest/doctest.h>
#include "frontdoor/cache_store.hpp"

#include <thread>
#include <vector>

using namespace frontdoor;

TEST_CASE("InMemoryCacheStore - Miss on empty store") {
    InMemoryCacheStore store;
    CHECK_FALSE(store.get("ns", "key").has_value());
    CHECK(store.size() == 0);
}

TEST_CASE("InMemoryCacheStore - Set then get") {
    InMemoryCacheStore store;
    store.set("ns", "key", "value", std::chrono::seconds{60});
    auto value = store.get("ns", "key");
    REQUIRE(value.has_value());
    CHECK(*value == "value");
}

TEST_CASE("InMemoryCacheStore - Namespaces are isolated") {
    InMemoryCacheStore store;
    store.set("certs", "key", "a", std::chrono::seconds{60});
    store.set("other", "key", "b", std::chrono::seconds{60});

    CHECK(store.get("certs", "key").value() == "a");
    CHECK(store.get("other", "key").value() == "b");
    CHECK_FALSE(store.get("third", "key").has_value());
}

TEST_CASE("InMemoryCacheStore - Writes replace the whole entry") {
    InMemoryCacheStore store;
    store.set("ns", "key", "first", std::chrono::seconds{60});
    store.set("ns", "key", "second", std::chrono::seconds{60});
    CHECK(store.get("ns", "key").value() == "second");
    CHECK(store.size() == 1);
}

TEST_CASE("InMemoryCacheStore - Expired entries are evicted on read") {
    InMemoryCacheStore store;
    store.set("ns", "key", "value", std::chrono::seconds{1});
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    CHECK_FALSE(store.get("ns", "key").has_value());
    CHECK(store.size() == 0);
}

TEST_CASE("InMemoryCacheStore - Non-positive TTL is rejected") {
    InMemoryCacheStore store;
    CHECK_THROWS_AS(store.set("ns", "key", "value", std::chrono::seconds{0}), CacheError);
    CHECK_THROWS_AS(store.set("ns", "key", "value", std::chrono::seconds{-5}), CacheError);
    CHECK(store.size() == 0);
}

TEST_CASE("InMemoryCacheStore - Concurrent readers and writers") {
    InMemoryCacheStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < 200; ++i) {
                store.set("ns", "shared", "writer-" + std::to_string(t), std::chrono::seconds{60});
                (void)store.get("ns", "shared");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto value = store.get("ns", "shared");
    REQUIRE(value.has_value());
    CHECK(value->rfind("writer-", 0) == 0);
    CHECK(store.size() == 1);
}
