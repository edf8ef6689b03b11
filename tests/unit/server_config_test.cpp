#include <catch2/catch_all.hpp>

#include <semsearch/serve/server_config.hpp>

#include <cstdlib>
#include <vector>

using namespace semsearch::serve;
using semsearch::core::error_code;

namespace {

void clear_env() {
    for (const char* name : {"SEMSEARCH_LISTEN", "SEMSEARCH_MAX_BATCH_SIZE", "SEMSEARCH_MAX_WAIT_US",
                             "SEMSEARCH_EF_SEARCH", "SEMSEARCH_WORKERS", "SEMSEARCH_VERBOSE"}) {
        ::unsetenv(name);
    }
}

auto parse(std::vector<const char*> args) {
    args.insert(args.begin(), "semsearch_server");
    return parse_server_args(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("server flags override defaults", "[serve][config]") {
    clear_env();
    auto c = parse({"--index=/tmp/x.ssidx", "--listen=0.0.0.0:6000", "--max_batch_size=8",
                    "--max_wait_us=500", "--ef_search=128", "--workers=3", "--dim=96",
                    "--no_mmap", "--verbose"});
    REQUIRE(c.has_value());
    CHECK(c->index_path == "/tmp/x.ssidx");
    CHECK(c->listen_address == "0.0.0.0:6000");
    CHECK(c->scheduler.max_batch_size == 8);
    CHECK(c->scheduler.max_wait == std::chrono::microseconds(500));
    CHECK(c->scheduler.ef_search == 128);
    CHECK(c->scheduler.num_workers == 3);
    CHECK(c->embedding_dim == 96);
    CHECK_FALSE(c->use_mmap);
    CHECK(c->verbose);
    CHECK(c->scheduler.verbose);
}

TEST_CASE("server defaults", "[serve][config]") {
    clear_env();
    auto c = parse({"--index=a.ssidx"});
    REQUIRE(c.has_value());
    CHECK(c->listen_address == "127.0.0.1:50051");
    CHECK(c->scheduler.max_batch_size == 32);
    CHECK(c->scheduler.max_wait == std::chrono::microseconds(2000));
    CHECK(c->use_mmap);
    CHECK(c->embedding_dim == 384);
    CHECK_FALSE(c->verbose);
}

TEST_CASE("environment sits between defaults and flags", "[serve][config]") {
    clear_env();
    ::setenv("SEMSEARCH_LISTEN", "10.0.0.1:7000", 1);
    ::setenv("SEMSEARCH_MAX_BATCH_SIZE", "4", 1);
    ::setenv("SEMSEARCH_WORKERS", "2", 1);
    auto c = parse({"--index=a.ssidx", "--max_batch_size=6"});
    REQUIRE(c.has_value());
    CHECK(c->listen_address == "10.0.0.1:7000");
    CHECK(c->scheduler.max_batch_size == 6);
    CHECK(c->scheduler.num_workers == 2);

    ::setenv("SEMSEARCH_EF_SEARCH", "lots", 1);
    auto bad = parse({"--index=a.ssidx"});
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == error_code::config_invalid);
    clear_env();
}

TEST_CASE("invalid server arguments", "[serve][config][errors]") {
    clear_env();
    SECTION("unknown flag") {
        auto c = parse({"--index=a", "--frobnicate"});
        REQUIRE_FALSE(c.has_value());
        CHECK(c.error().code == error_code::config_invalid);
        CHECK(c.error().component == "serve.config");
    }
    SECTION("missing index") {
        auto c = parse({"--listen=1.2.3.4:5"});
        REQUIRE_FALSE(c.has_value());
        CHECK(c.error().code == error_code::config_invalid);
    }
    SECTION("zero batch size") {
        auto c = parse({"--index=a", "--max_batch_size=0"});
        REQUIRE_FALSE(c.has_value());
        CHECK(c.error().code == error_code::config_invalid);
    }
    SECTION("malformed number") {
        auto c = parse({"--index=a", "--max_wait_us=12ms"});
        REQUIRE_FALSE(c.has_value());
        CHECK(c.error().code == error_code::config_invalid);
    }
    SECTION("zero dimension") {
        auto c = parse({"--index=a", "--dim=0"});
        REQUIRE_FALSE(c.has_value());
        CHECK(c.error().code == error_code::config_invalid);
    }
    SECTION("help needs no index") {
        auto c = parse({"--help"});
        REQUIRE(c.has_value());
        CHECK(c->show_help);
        CHECK_FALSE(server_usage().empty());
    }
}
