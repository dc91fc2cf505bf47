#include <catch2/catch.hpp>
#include <weft/compiler.hpp>

using namespace weft;

static Catalog compile_ok(const std::string& src) {
    auto r = compile(src, "site.pp");
    if (r.is_err()) FAIL(r.error().format());
    return std::move(r).value();
}

static NodeId id_of(const Catalog& c, const std::string& type, const std::string& title) {
    auto id = c.find({TypeName::parse(type).value(), InterpString::literal(title)});
    REQUIRE(id.has_value());
    return *id;
}

static size_t position(const Catalog& c, NodeId id) {
    const auto& order = c.order();
    for (size_t i = 0; i < order.size(); ++i) {
        if (order[i] == id) return i;
    }
    return order.size();
}

TEST_CASE("order is a linear extension of every edge", "[catalog]") {
    auto c = compile_ok(
        "service { 'app': }\n"
        "package { 'app': }\n"
        "file { '/etc/app.conf': }\n"
        "user { 'app': }\n"
        "Package['app'] -> File['/etc/app.conf'] ~> Service['app']\n"
        "User['app'] -> [Package['app'], Service['app']]\n");
    REQUIRE(c.order().size() == c.size());
    for (const auto& e : c.edges()) {
        INFO(c.node(e.source).identity.str() << " -> " << c.node(e.target).identity.str());
        REQUIRE(position(c, e.source) < position(c, e.target));
    }
}

TEST_CASE("unconstrained resources keep declaration order", "[catalog]") {
    auto c = compile_ok("file { 'c': }\nfile { 'a': }\nfile { 'b': }\n");
    REQUIRE(c.order() == std::vector<NodeId>{0, 1, 2});
}

TEST_CASE("ties are broken by declaration order", "[catalog]") {
    // d must precede a; b and c are free and were declared before d
    auto c = compile_ok("file { 'a': }\nfile { 'b': }\nfile { 'c': }\nfile { 'd': }\n"
                        "File['d'] -> File['a']\n");
    REQUIRE(c.order() == std::vector<NodeId>{1, 2, 3, 0});
}

TEST_CASE("two-node cycle names both resources", "[catalog]") {
    auto r = compile("service { 'a': }\nservice { 'b': }\n"
                     "Service['a'] -> Service['b']\n"
                     "Service['b'] -> Service['a']\n", "site.pp");
    REQUIRE(r.is_err());
    const auto& e = r.error();
    CHECK(e.code == WeftError::Cycle);
    CHECK(e.message == "dependency cycle: Service['a'] -> Service['b'] -> Service['a']");
    CHECK(e.hint == "remove one of the relationships in the cycle");
    CHECK(e.line == 4);
}

TEST_CASE("self relationship is a cycle", "[catalog]") {
    auto r = compile("file { '/a': }\nFile['/a'] -> File['/a']\n");
    REQUIRE(r.is_err());
    CHECK(r.error().code == WeftError::Cycle);
    CHECK(r.error().message == "dependency cycle: File['/a'] -> File['/a']");
}

TEST_CASE("cycle through notify and metaparameters", "[catalog]") {
    auto r = compile("file { 'x': notify => Service['y'] }\n"
                     "service { 'y': }\n"
                     "exec { 'z': require => Service['y'], before => File['x'] }\n");
    REQUIRE(r.is_err());
    CHECK(r.error().code == WeftError::Cycle);
    CHECK(r.error().message.find("File['x']") != std::string::npos);
    CHECK(r.error().message.find("Exec['z']") != std::string::npos);
}

TEST_CASE("edges_from and notify_targets", "[catalog]") {
    auto c = compile_ok(
        "file { '/etc/nginx.conf': }\n"
        "service { 'nginx': }\n"
        "exec { 'reload': }\n"
        "file { '/var/www': }\n"
        "File['/etc/nginx.conf'] ~> [Service['nginx'], Exec['reload']]\n"
        "File['/etc/nginx.conf'] -> File['/var/www']\n");
    auto conf = id_of(c, "file", "/etc/nginx.conf");
    auto nginx = id_of(c, "service", "nginx");
    auto reload = id_of(c, "exec", "reload");

    REQUIRE(c.edges_from(conf).size() == 3);
    REQUIRE(c.edges_from(nginx).empty());
    REQUIRE(c.notify_targets(conf) == std::vector<NodeId>{nginx, reload});
    REQUIRE(c.notify_targets(reload).empty());
}

TEST_CASE("catalog nodes keep identity and attributes", "[catalog]") {
    auto c = compile_ok("file { '/tmp/two': ensure => directory, mode => '0755' }\n");
    REQUIRE(c.size() == 1);
    const auto& n = c.node(0);
    REQUIRE(n.identity.str() == "File['/tmp/two']");
    REQUIRE(n.attributes.size() == 2);
    REQUIRE(c.nodes().size() == 1);
}

TEST_CASE("build_catalog rejects dangling endpoints", "[catalog]") {
    ResourceRegistry reg;
    REQUIRE(reg.declare({TypeName::parse("file").value(), InterpString::literal("a")},
                        {}, 0, {}).is_ok());
    std::vector<RelationshipEdge> edges{{0, 5, EdgeKind::Order, {"x.pp", 2, 1}}};
    auto r = build_catalog(std::move(reg), std::move(edges));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WeftError::Unresolved);
}

TEST_CASE("empty manifest compiles to an empty catalog", "[catalog]") {
    auto c = compile_ok("# nothing\n");
    REQUIRE(c.size() == 0);
    REQUIRE(c.edges().empty());
    REQUIRE(c.order().empty());
}
