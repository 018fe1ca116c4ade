// Sniper Taker Engine - JSON-RPC Helper Tests

#include <catch2/catch_test_macros.hpp>
#include <sniper/rpc.hpp>

using namespace sniper;
using json = nlohmann::json;

TEST_CASE("Hex quantities", "[rpc]") {
    SECTION("Parse") {
        REQUIRE(parse_hex_quantity(json("0x1a")) == 26);
        REQUIRE(parse_hex_quantity(json("0X0")) == 0);
        REQUIRE(parse_hex_quantity(json("0x3b9aca00")) == 1000000000);
        REQUIRE(parse_hex_quantity(json(42u)) == 42);
    }

    SECTION("Reject") {
        REQUIRE_THROWS_AS(parse_hex_quantity(json("26")), RpcError);
        REQUIRE_THROWS_AS(parse_hex_quantity(json("0x")), RpcError);
        REQUIRE_THROWS_AS(parse_hex_quantity(json("0xzz")), RpcError);
        REQUIRE_THROWS_AS(parse_hex_quantity(json("0x1g")), RpcError);
        REQUIRE_THROWS_AS(parse_hex_quantity(json(nullptr)), RpcError);
    }

    SECTION("Format") {
        REQUIRE(to_hex_quantity(0) == "0x0");
        REQUIRE(to_hex_quantity(255) == "0xff");
        REQUIRE(parse_hex_quantity(json(to_hex_quantity(123456789))) == 123456789);
    }

    SECTION("RPC errors are execution failures") {
        try {
            (void)parse_hex_quantity(json("nope"));
            FAIL("expected RpcError");
        } catch (const ExecutionFailure& e) {
            REQUIRE(std::string(e.what()).find("nope") != std::string::npos);
        }
    }
}
