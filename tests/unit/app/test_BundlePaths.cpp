#include <doctest/doctest.h>

#include <webshell/app/BundlePaths.hpp>

using namespace WS;
using namespace WS::App;

TEST_SUITE("BundlePaths") {

TEST_CASE("normalize_bundle_root canonicalizes absolute roots") {
    auto root = normalize_bundle_root("/opt/webshell/apps/clock/");
    REQUIRE(root.has_value());
    CHECK(*root == "/opt/webshell/apps/clock");

    CHECK_FALSE(normalize_bundle_root("apps/clock").has_value());
    CHECK_FALSE(normalize_bundle_root("/").has_value());
    CHECK_FALSE(normalize_bundle_root("/apps/../etc").has_value());
}

TEST_CASE("is_bundle_relative rejects escapes") {
    CHECK(is_bundle_relative("index.html"));
    CHECK(is_bundle_relative("dist/main.html"));
    CHECK_FALSE(is_bundle_relative(""));
    CHECK_FALSE(is_bundle_relative("/etc/passwd"));
    CHECK_FALSE(is_bundle_relative("~/index.html"));
    CHECK_FALSE(is_bundle_relative("../index.html"));
    CHECK_FALSE(is_bundle_relative("dist//main.html"));
    CHECK_FALSE(is_bundle_relative("dist/"));
    CHECK_FALSE(is_bundle_relative("dist\\main.html"));
}

TEST_CASE("resolve_bundle_relative joins under the root") {
    auto resolved = resolve_bundle_relative("/apps/clock", "dist/index.html");
    REQUIRE(resolved.has_value());
    CHECK(*resolved == "/apps/clock/dist/index.html");

    auto escaped = resolve_bundle_relative("/apps/clock", "../weather/index.html");
    REQUIRE_FALSE(escaped.has_value());
    CHECK(escaped.error().code == Error::Code::InvalidPathSubcomponent);
}

TEST_CASE("ensure_within_bundle checks component boundaries") {
    CHECK(ensure_within_bundle("/apps/clock", "/apps/clock").has_value());
    CHECK(ensure_within_bundle("/apps/clock", "/apps/clock/index.html").has_value());
    CHECK_FALSE(ensure_within_bundle("/apps/clock", "/apps/clockwork/index.html").has_value());
    CHECK_FALSE(ensure_within_bundle("/apps/clock", "/apps").has_value());
}

TEST_CASE("bundle_directory_name returns the last component") {
    CHECK(bundle_directory_name("/apps/clock").value() == "clock");
    CHECK_FALSE(bundle_directory_name("/").has_value());
    CHECK_FALSE(bundle_directory_name("clock").has_value());
}

} // TEST_SUITE
