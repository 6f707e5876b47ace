#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "response_cache.hpp"
#include <stdexcept>
#include <thread>
#include <chrono>
#include <ctime>
#include <limits>
#include <vector>

using namespace sturdy;

// ── Basic get/set ────────────────────────────────────────────

TEST_CASE("ResponseCache: miss on empty cache", "[cache]") {
    ResponseCache cache(3600, 100, 0);
    REQUIRE_FALSE(cache.get("users_abc").has_value());
}

TEST_CASE("ResponseCache: hit after set", "[cache]") {
    ResponseCache cache(3600, 100, 0);
    cache.set("k", {{"name", "alice"}});

    auto result = cache.get("k");
    REQUIRE(result.has_value());
    REQUIRE((*result)["name"] == "alice");
}

TEST_CASE("ResponseCache: stored null is a hit", "[cache]") {
    ResponseCache cache(3600, 100, 0);
    cache.set("k", nullptr);

    auto result = cache.get("k");
    REQUIRE(result.has_value());
    REQUIRE(result->is_null());
    REQUIRE(cache.get_stats().hits == 1);
}

TEST_CASE("ResponseCache: set replaces existing value", "[cache]") {
    ResponseCache cache(3600, 100, 0);
    cache.set("k", 1);
    cache.set("k", 2);

    REQUIRE(cache.size() == 1);
    REQUIRE(cache.get("k").value() == 2);
}

TEST_CASE("ResponseCache: rejects zero max_size", "[cache]") {
    REQUIRE_THROWS_AS(ResponseCache(3600, 0, 0), std::invalid_argument);
}

TEST_CASE("ResponseCache: rejects negative or NaN ttl", "[cache]") {
    REQUIRE_THROWS_AS(ResponseCache(-1, 10, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(ResponseCache(std::numeric_limits<double>::quiet_NaN(), 10, 0),
                      std::invalid_argument);
}

// ── Expiry ───────────────────────────────────────────────────

TEST_CASE("ResponseCache: entry expires after ttl without a sweep", "[cache]") {
    ResponseCache cache(3600, 100, 0);
    cache.set("short", "v", 0.05);
    REQUIRE(cache.get("short").has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    REQUIRE_FALSE(cache.get("short").has_value());
    REQUIRE(cache.size() == 0);
}

TEST_CASE("ResponseCache: zero ttl is immediately expired", "[cache]") {
    ResponseCache cache(3600, 100, 0);
    cache.set("k", "v", 0.0);
    REQUIRE_FALSE(cache.get("k").has_value());
}

TEST_CASE("ResponseCache: per-entry ttl overrides default", "[cache]") {
    ResponseCache cache(0.05, 100, 0);
    cache.set("default", 1);
    cache.set("long", 2, 3600.0);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    REQUIRE_FALSE(cache.get("default").has_value());
    REQUIRE(cache.get("long").has_value());
}

TEST_CASE("ResponseCache: cleanup_expired counts removed entries", "[cache]") {
    ResponseCache cache(3600, 100, 0);
    cache.set("a", 1, 0.01);
    cache.set("b", 2, 0.01);
    cache.set("c", 3);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(cache.cleanup_expired() == 2);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.cleanup_expired() == 0);
}

TEST_CASE("ResponseCache: background sweep removes expired entries", "[cache]") {
    ResponseCache cache(0.02, 100, 0.05);
    cache.set("a", 1);
    cache.set("b", 2);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (cache.size() > 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

    REQUIRE(cache.size() == 0);
    // Sweeping is not a lookup
    REQUIRE(cache.get_stats().total_requests == 0);
}

TEST_CASE("ResponseCache: destructor stops sweep thread promptly", "[cache]") {
    auto start = std::chrono::steady_clock::now();
    {
        ResponseCache cache(3600, 10, 300);
        cache.set("k", 1);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed < std::chrono::seconds(1));
}

TEST_CASE("ResponseCache: huge per-entry ttl never expires", "[cache]") {
    ResponseCache cache(3600, 10, 0);
    cache.set("decade", 1, 1e10);
    cache.set("forever", 2, std::numeric_limits<double>::infinity());

    REQUIRE(cache.get("decade").value() == 1);
    REQUIRE(cache.get("forever").value() == 2);
    REQUIRE(cache.cleanup_expired() == 0);
}

TEST_CASE("ResponseCache: huge default ttl never expires", "[cache]") {
    ResponseCache decade(1e10, 10, 0);
    decade.set("k", "v");
    REQUIRE(decade.get("k").has_value());

    ResponseCache forever(std::numeric_limits<double>::infinity(), 10, 0);
    forever.set("k", "v");
    REQUIRE(forever.get("k").has_value());
}

TEST_CASE("ResponseCache: huge sweep interval idles and stops promptly", "[cache]") {
    auto start = std::chrono::steady_clock::now();
    std::clock_t cpu_start = std::clock();
    {
        ResponseCache cache(3600, 10, 1e10);
        cache.set("k", 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        REQUIRE(cache.get("k").has_value());
    }
    double cpu_seconds = static_cast<double>(std::clock() - cpu_start) / CLOCKS_PER_SEC;

    REQUIRE(cpu_seconds < 0.15);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
}

// ── LRU eviction ─────────────────────────────────────────────

TEST_CASE("ResponseCache: inserting past capacity evicts oldest", "[cache]") {
    ResponseCache cache(3600, 3, 0);
    cache.set("k1", 1);
    cache.set("k2", 2);
    cache.set("k3", 3);
    cache.set("k4", 4);

    REQUIRE(cache.size() == 3);
    REQUIRE_FALSE(cache.get("k1").has_value());
    REQUIRE(cache.get("k2").has_value());
    REQUIRE(cache.get("k4").has_value());
}

TEST_CASE("ResponseCache: get refreshes recency", "[cache]") {
    ResponseCache cache(3600, 3, 0);
    cache.set("k1", 1);
    cache.set("k2", 2);
    cache.set("k3", 3);

    REQUIRE(cache.get("k1").has_value());
    cache.set("k4", 4);

    REQUIRE(cache.get("k1").has_value());
    REQUIRE_FALSE(cache.get("k2").has_value());
}

TEST_CASE("ResponseCache: replacing a key at capacity evicts nothing", "[cache]") {
    ResponseCache cache(3600, 2, 0);
    cache.set("k1", 1);
    cache.set("k2", 2);
    cache.set("k1", 10);

    REQUIRE(cache.size() == 2);
    REQUIRE(cache.get("k2").has_value());
    REQUIRE(cache.get("k1").value() == 10);
}

// ── Remove / clear ───────────────────────────────────────────

TEST_CASE("ResponseCache: remove reports presence", "[cache]") {
    ResponseCache cache(3600, 10, 0);
    cache.set("k", 1);
    REQUIRE(cache.remove("k"));
    REQUIRE_FALSE(cache.remove("k"));
    REQUIRE_FALSE(cache.get("k").has_value());
}

TEST_CASE("ResponseCache: clear drops entries and counters", "[cache]") {
    ResponseCache cache(3600, 10, 0);
    cache.set("a", 1);
    cache.set("b", 2);
    (void)cache.get("a");
    (void)cache.get("zzz");

    cache.clear();
    auto stats = cache.get_stats();
    REQUIRE(stats.size == 0);
    REQUIRE(stats.hits == 0);
    REQUIRE(stats.misses == 0);
    REQUIRE(stats.hit_rate == 0.0);
}

// ── Stats ────────────────────────────────────────────────────

TEST_CASE("ResponseCache: stats track hits and misses", "[cache]") {
    ResponseCache cache(3600, 10, 0);
    cache.set("a", 1);
    (void)cache.get("a");
    (void)cache.get("a");
    (void)cache.get("a");
    (void)cache.get("missing");

    auto stats = cache.get_stats();
    REQUIRE(stats.hits == 3);
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.total_requests == 4);
    REQUIRE(stats.size == 1);
    REQUIRE(stats.max_size == 10);
    REQUIRE(stats.hit_rate == Catch::Approx(0.75));

    auto j = stats.to_json();
    REQUIRE(j["hits"] == 3);
    REQUIRE(j["total_requests"] == 4);
}

TEST_CASE("ResponseCache: expired lookup counts as miss", "[cache]") {
    ResponseCache cache(3600, 10, 0);
    cache.set("a", 1, 0.0);
    (void)cache.get("a");
    REQUIRE(cache.get_stats().misses == 1);
    REQUIRE(cache.get_stats().hits == 0);
}

// ── Key generation ───────────────────────────────────────────

TEST_CASE("ResponseCache: key ignores parameter insertion order", "[cache]") {
    nlohmann::json a;
    a["lat"] = 1.5;
    a["lon"] = 2.5;
    nlohmann::json b;
    b["lon"] = 2.5;
    b["lat"] = 1.5;

    REQUIRE(ResponseCache::generate_key("https://api.test/v1/near", a) ==
            ResponseCache::generate_key("https://api.test/v1/near", b));
}

TEST_CASE("ResponseCache: key format is segment and 16 hex chars", "[cache]") {
    auto key = ResponseCache::generate_key("https://api.test/v1/users", {{"id", 7}});
    REQUIRE(key.rfind("users_", 0) == 0);
    auto hash = key.substr(6);
    REQUIRE(hash.size() == 16);
    REQUIRE(hash.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("ResponseCache: key differs by params and endpoint", "[cache]") {
    auto base = ResponseCache::generate_key("/v1/users", {{"id", 1}});
    REQUIRE(base != ResponseCache::generate_key("/v1/users", {{"id", 2}}));
    REQUIRE(base != ResponseCache::generate_key("/v2/users", {{"id", 1}}));
    REQUIRE(base != ResponseCache::generate_key("/v1/users"));
}

TEST_CASE("ResponseCache: empty params equal no params", "[cache]") {
    REQUIRE(ResponseCache::generate_key("/v1/users", nlohmann::json::object()) ==
            ResponseCache::generate_key("/v1/users"));
}

// ── Memoization ──────────────────────────────────────────────

TEST_CASE("ResponseCache: cached calls loader once per args", "[cache]") {
    ResponseCache cache(3600, 10, 0);
    int calls = 0;
    auto lookup = cache.cached("geo", [&calls](const nlohmann::json& args) {
        calls++;
        return nlohmann::json{{"echo", args}};
    });

    auto first = lookup({{"q", "x"}});
    auto second = lookup({{"q", "x"}});
    REQUIRE(calls == 1);
    REQUIRE(first == second);

    (void)lookup({{"q", "y"}});
    REQUIRE(calls == 2);
}

TEST_CASE("ResponseCache: cached honors its ttl", "[cache]") {
    ResponseCache cache(3600, 10, 0);
    int calls = 0;
    auto lookup = cache.cached("geo", [&calls](const nlohmann::json&) {
        calls++;
        return nlohmann::json(calls);
    }, 0.02);

    (void)lookup(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    (void)lookup(1);
    REQUIRE(calls == 2);
}

TEST_CASE("ResponseCache: cached does not store failures", "[cache]") {
    ResponseCache cache(3600, 10, 0);
    int calls = 0;
    auto lookup = cache.cached("geo", [&calls](const nlohmann::json&) -> nlohmann::json {
        calls++;
        if (calls == 1) throw std::runtime_error("boom");
        return "ok";
    });

    REQUIRE_THROWS_AS(lookup(1), std::runtime_error);
    REQUIRE(lookup(1) == "ok");
    REQUIRE(cache.size() == 1);
}

TEST_CASE("ResponseCache: concurrent access keeps size bounded", "[cache]") {
    ResponseCache cache(3600, 50, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 200; ++i) {
                std::string key = "k" + std::to_string(t) + "_" + std::to_string(i);
                cache.set(key, i);
                (void)cache.get(key);
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(cache.size() == 50);
    REQUIRE(cache.get_stats().total_requests == 800);
}
