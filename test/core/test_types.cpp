#include <catch2/catch_test_macros.hpp>

#include <mcp_gateway/core/types.hpp>

#include <string>

using namespace mcp_gateway;

// ===========================================================================
// ServerName
// ===========================================================================

TEST_CASE("ServerName: valid names", "[types][ServerName]") {
    SECTION("plain file name") {
        auto r = ServerName::Create("calculator.py");
        REQUIRE(r.IsOk());
        CHECK(r.Value().Value() == "calculator.py");
    }
    SECTION("dots inside the name") {
        CHECK(ServerName::Create("weather.v2.py").IsOk());
    }
    SECTION("max 255 bytes") {
        CHECK(ServerName::Create(std::string(255, 'a')).IsOk());
    }
}

TEST_CASE("ServerName: rejected names", "[types][ServerName]") {
    SECTION("empty") {
        CHECK(ServerName::Create("").IsErr());
    }
    SECTION("too long") {
        auto r = ServerName::Create(std::string(256, 'a'));
        REQUIRE(r.IsErr());
        CHECK(r.Error().find("255") != std::string::npos);
    }
    SECTION("parent directory") {
        CHECK(ServerName::Create("..").IsErr());
        CHECK(ServerName::Create("a..b.py").IsErr());
    }
    SECTION("path separators") {
        CHECK(ServerName::Create("sub/calc.py").IsErr());
        CHECK(ServerName::Create("sub\\calc.py").IsErr());
        CHECK(ServerName::Create("/etc/passwd").IsErr());
    }
    SECTION("NUL byte") {
        CHECK(ServerName::Create(std::string("calc\0.py", 8)).IsErr());
    }
    SECTION("hidden file") {
        auto r = ServerName::Create(".env");
        REQUIRE(r.IsErr());
        CHECK(r.Error().find("'.'") != std::string::npos);
    }
}

TEST_CASE("ServerName: WithExtension appends only when missing", "[types][ServerName]") {
    auto bare = ServerName::WithExtension("calculator", ".py");
    REQUIRE(bare.IsOk());
    CHECK(bare.Value().Value() == "calculator.py");

    auto full = ServerName::WithExtension("calculator.py", ".py");
    REQUIRE(full.IsOk());
    CHECK(full.Value().Value() == "calculator.py");

    auto none = ServerName::WithExtension("tool.sh", "");
    REQUIRE(none.IsOk());
    CHECK(none.Value().Value() == "tool.sh");
}

TEST_CASE("ServerName: WithExtension still validates", "[types][ServerName]") {
    CHECK(ServerName::WithExtension("../secret", ".py").IsErr());
    CHECK(ServerName::WithExtension(".hidden", ".py").IsErr());
}

TEST_CASE("ServerName: equality", "[types][ServerName]") {
    auto a = ServerName::Create("a.py").Value();
    auto b = ServerName::Create("a.py").Value();
    auto c = ServerName::Create("c.py").Value();
    CHECK(a == b);
    CHECK(a != c);
}

TEST_CASE("EndsWith", "[types]") {
    CHECK(EndsWith("calc.py", ".py"));
    CHECK_FALSE(EndsWith("calc.pyc", ".py"));
    CHECK_FALSE(EndsWith("py", ".py"));
    CHECK(EndsWith("anything", ""));
}
