#include <catch2/catch_test_macros.hpp>

#include <mcp_sandbox/core/types.hpp>

#include <limits>
#include <string>

using namespace mcp_sandbox;

// ===========================================================================
// ToolName
// ===========================================================================

TEST_CASE("ToolName: valid names", "[types][ToolName]") {
    SECTION("lower case with underscore") {
        auto r = ToolName::Create("read_file");
        REQUIRE(r.IsOk());
        CHECK(r.Value().Value() == "read_file");
    }
    SECTION("mixed case, digits and dash") {
        CHECK(ToolName::Create("List-Dir2").IsOk());
    }
    SECTION("exactly 64 characters") {
        CHECK(ToolName::Create(std::string(64, 'a')).IsOk());
    }
}

TEST_CASE("ToolName: invalid names", "[types][ToolName]") {
    SECTION("empty") {
        auto r = ToolName::Create("");
        REQUIRE(r.IsErr());
        CHECK(r.Error().find("empty") != std::string::npos);
    }
    SECTION("65 characters") {
        CHECK(ToolName::Create(std::string(65, 'a')).IsErr());
    }
    SECTION("space") {
        CHECK(ToolName::Create("read file").IsErr());
    }
    SECTION("slash") {
        CHECK(ToolName::Create("tools/call").IsErr());
    }
    SECTION("dot") {
        CHECK(ToolName::Create("fs.read").IsErr());
    }
}

TEST_CASE("ToolName: value semantics", "[types][ToolName]") {
    auto a = ToolName::Create("greeting").Value();
    auto b = a;
    CHECK(a == b);
    CHECK(a != ToolName::Create("other").Value());
}

// ===========================================================================
// ByteSize
// ===========================================================================

TEST_CASE("ByteSize: plain byte counts", "[types][ByteSize]") {
    auto r = ByteSize::Parse("1048576");
    REQUIRE(r.IsOk());
    CHECK(r.Value().Bytes() == 1048576);
    CHECK(ByteSize::Parse("12B").Value().Bytes() == 12);
}

TEST_CASE("ByteSize: suffixes are binary multiples", "[types][ByteSize]") {
    CHECK(ByteSize::Parse("512K").Value().Bytes() == 512ULL * 1024);
    CHECK(ByteSize::Parse("512kb").Value().Bytes() == 512ULL * 1024);
    CHECK(ByteSize::Parse("10MB").Value().Bytes() == 10ULL * 1024 * 1024);
    CHECK(ByteSize::Parse("10 MiB").Value().Bytes() == 10ULL * 1024 * 1024);
    CHECK(ByteSize::Parse("2G").Value().Bytes() == 2ULL * 1024 * 1024 * 1024);
    CHECK(ByteSize::Parse(" 3 gb ").Value().Bytes() == 3ULL * 1024 * 1024 * 1024);
}

TEST_CASE("ByteSize: rejects bad input", "[types][ByteSize]") {
    CHECK(ByteSize::Parse("").IsErr());
    CHECK(ByteSize::Parse("MB").IsErr());
    CHECK(ByteSize::Parse("-5").IsErr());
    CHECK(ByteSize::Parse("10XB").IsErr());
    CHECK(ByteSize::Parse("1.5M").IsErr());
    CHECK(ByteSize::Parse("0").IsErr());
    CHECK(ByteSize::Parse("99999999999999999999").IsErr());
    CHECK(ByteSize::Parse("17179869184G").IsErr());
}

TEST_CASE("ByteSize: ToString picks the largest exact unit", "[types][ByteSize]") {
    CHECK(ByteSize::Parse("10MB").Value().ToString() == "10 MiB");
    CHECK(ByteSize::Parse("2048").Value().ToString() == "2 KiB");
    CHECK(ByteSize::Parse("1G").Value().ToString() == "1 GiB");
    CHECK(ByteSize::Parse("1500").Value().ToString() == "1500 bytes");
}

TEST_CASE("ByteSize: FromBytes", "[types][ByteSize]") {
    CHECK(ByteSize::FromBytes(42).Value().Bytes() == 42);
    CHECK(ByteSize::FromBytes(0).IsErr());
    CHECK(ByteSize::FromBytes(std::numeric_limits<std::uint64_t>::max()).IsOk());
}
