#include <catch2/catch.hpp>
#include <pkgindex/name.hpp>

using namespace pkgindex;

TEST_CASE("valid package names", "[name]") {
    REQUIRE(PackageName::parse("text").is_ok());
    REQUIRE(PackageName::parse("aeson-pretty").is_ok());
    REQUIRE(PackageName::parse("base64-bytestring").is_ok());
    REQUIRE(PackageName::parse("HUnit").value().str() == "HUnit");
    REQUIRE(PackageName::parse("3d-graphics").is_ok());
}

TEST_CASE("invalid package names", "[name]") {
    REQUIRE(PackageName::parse("").is_err());
    REQUIRE(PackageName::parse("foo/bar").is_err());
    REQUIRE(PackageName::parse("-foo").is_err());
    REQUIRE(PackageName::parse("foo-").is_err());
    REQUIRE(PackageName::parse("foo--bar").is_err());
    REQUIRE(PackageName::parse("foo-2").is_err());
    REQUIRE(PackageName::parse("foo_bar").is_err());
    REQUIRE(PackageName::parse("foo bar").error().code == IndexError::InvalidArg);
}

TEST_CASE("package names compare case-sensitively", "[name]") {
    auto a = PackageName::parse("hunit").value();
    auto b = PackageName::parse("HUnit").value();
    REQUIRE(a != b);
    REQUIRE(b < a);
    REQUIRE(a == PackageName::parse("hunit").value());
}
