#include <catch2/catch.hpp>
#include <weft/compiler.hpp>
#include <weft/registry.hpp>

using namespace weft;

static ResourceIdentity ident(const std::string& t, const std::string& title) {
    return {TypeName::parse(t).value(), InterpString::literal(title)};
}

static SourcePos at(int line, int col = 1) {
    return {"site.pp", line, col};
}

TEST_CASE("declare assigns ids in declaration order", "[registry]") {
    ResourceRegistry reg;
    REQUIRE(reg.declare(ident("file", "/tmp/one"), {}, 0, at(1)).value() == 0);
    REQUIRE(reg.declare(ident("file", "/tmp/two"), {}, 1, at(2)).value() == 1);
    REQUIRE(reg.size() == 2);
    REQUIRE(reg.node(1).identity == ident("File", "/tmp/two"));
    REQUIRE(reg.node(1).order == 1);
}

TEST_CASE("duplicate declaration names both sites", "[registry]") {
    ResourceRegistry reg;
    REQUIRE(reg.declare(ident("file", "/tmp/one"), {}, 0, at(1)).is_ok());
    auto r = reg.declare(ident("File", "/tmp/one"), {}, 1, at(5, 3));
    REQUIRE(r.is_err());
    CHECK(r.error().code == WeftError::Duplicate);
    CHECK(r.error().message == "duplicate declaration of File['/tmp/one']");
    CHECK(r.error().hint == "first declared at site.pp:1:1");
    CHECK(r.error().line == 5);
    CHECK(r.error().col == 3);
}

TEST_CASE("lookup finds declared and rejects undeclared", "[registry]") {
    ResourceRegistry reg;
    REQUIRE(reg.declare(ident("service", "ssh"), {}, 0, at(1)).is_ok());
    REQUIRE(reg.lookup(ident("Service", "ssh"), at(9)).value() == 0);
    REQUIRE(reg.find(ident("service", "ssh")).has_value());
    REQUIRE_FALSE(reg.find(ident("service", "nginx")).has_value());

    auto r = reg.lookup(ident("service", "nginx"), at(9, 4));
    REQUIRE(r.is_err());
    CHECK(r.error().code == WeftError::Unresolved);
    CHECK(r.error().message == "reference to undeclared resource Service['nginx']");
    CHECK(r.error().hint == "declare it with: service { 'nginx': }");
    CHECK(r.error().line == 9);
}

TEST_CASE("register_resources keeps attributes and positions", "[registry]") {
    auto m = parse_manifest("file { '/tmp/a': ensure => file, mode => '0644', }\n"
                            "service { 'ssh': }\n", "site.pp");
    REQUIRE(m.is_ok());
    auto reg = register_resources(m.value());
    REQUIRE(reg.is_ok());
    REQUIRE(reg.value().size() == 2);
    const auto& file = reg.value().node(0);
    REQUIRE(file.attributes.size() == 2);
    REQUIRE(file.attributes[1].name == "mode");
    REQUIRE(reg.value().node(1).pos.line == 2);
}

TEST_CASE("register_resources rejects duplicates", "[registry]") {
    auto m = parse_manifest("file { 'a': }\nFile { 'a': }\n");
    REQUIRE(m.is_ok());
    auto reg = register_resources(m.value());
    REQUIRE(reg.is_err());
    REQUIRE(reg.error().code == WeftError::Duplicate);
    REQUIRE(reg.error().line == 2);
}

TEST_CASE("interpolated titles are distinct from literal lookalikes", "[registry]") {
    auto m = parse_manifest("exec { \"/root/${scripts}/yo.sh\": }\n"
                            "exec { '/root/${scripts}/yo.sh': }\n");
    REQUIRE(m.is_ok());
    auto reg = register_resources(m.value());
    REQUIRE(reg.is_ok());
    REQUIRE(reg.value().size() == 2);
}

TEST_CASE("format_pos", "[registry]") {
    REQUIRE(format_pos({"a.pp", 3, 14}) == "a.pp:3:14");
}
