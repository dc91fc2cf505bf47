#include <catch2/catch.hpp>
#include <weft/compiler.hpp>
#include <weft/printer.hpp>

using namespace weft;

static const char* kSite =
    "file { '/tmp/one': ensure => directory }\n"
    "file { '/tmp/two': ensure => directory, mode => '0755' }\n"
    "file { '/tmp/two/three': content => \"hello from ${hostname}\" }\n"
    "service { 'nginx': ensure => running, require => File['/tmp/two'] }\n"
    "exec { \"/root/${scripts}/yo.sh\": }\n"
    "File['/tmp/one'] -> File['/tmp/two/three'] ~> Service['nginx']\n"
    "Exec[\"/root/${scripts}/yo.sh\"] <- Service['nginx']\n";

TEST_CASE("format_value renders every value kind", "[printer]") {
    auto m = parse_manifest(
        "x { 't': a => 'it\\'s', b => bare, c => 1.5, d => ['q', 2], e => File['/a'] }");
    REQUIRE(m.is_ok());
    const auto& attrs = m.value().resources[0].attributes;
    CHECK(format_value(attrs[0].value) == "'it\\'s'");
    CHECK(format_value(attrs[1].value) == "bare");
    CHECK(format_value(attrs[2].value) == "1.5");
    CHECK(format_value(attrs[3].value) == "['q', 2]");
    CHECK(format_value(attrs[4].value) == "File['/a']");
}

TEST_CASE("format_manifest aligns attributes and keeps chains", "[printer]") {
    auto m = parse_manifest(
        "file { '/tmp/two': ensure => directory, mode => '0755' }\n"
        "File['/tmp/two'] -> [File['/a'], File['/b']] <~ Service['s']\n");
    REQUIRE(m.is_ok());
    REQUIRE(format_manifest(m.value()) ==
        "file { '/tmp/two':\n"
        "  ensure => directory,\n"
        "  mode   => '0755',\n"
        "}\n"
        "\n"
        "File['/tmp/two'] -> [File['/a'], File['/b']] <~ Service['s']\n");
}

TEST_CASE("format_manifest output parses to the same manifest", "[printer]") {
    auto first = parse_manifest(kSite);
    REQUIRE(first.is_ok());
    auto second = parse_manifest(format_manifest(first.value()));
    REQUIRE(second.is_ok());

    const auto& a = first.value();
    const auto& b = second.value();
    REQUIRE(a.resources.size() == b.resources.size());
    for (size_t i = 0; i < a.resources.size(); ++i) {
        REQUIRE(a.resources[i].identity() == b.resources[i].identity());
        REQUIRE(a.resources[i].attributes.size() == b.resources[i].attributes.size());
        for (size_t j = 0; j < a.resources[i].attributes.size(); ++j) {
            REQUIRE(a.resources[i].attributes[j].value == b.resources[i].attributes[j].value);
        }
    }
    REQUIRE(a.chains.size() == b.chains.size());
    REQUIRE(a.chains[1].ops == b.chains[1].ops);
}

TEST_CASE("compiling format_catalog reproduces the catalog", "[printer]") {
    auto first = compile(kSite, "site.pp");
    REQUIRE(first.is_ok());
    auto text = format_catalog(first.value());
    INFO(text);
    auto second = compile(text, "roundtrip.pp");
    REQUIRE(second.is_ok());

    const auto& a = first.value();
    const auto& b = second.value();
    REQUIRE(a.size() == b.size());
    for (NodeId id = 0; id < a.size(); ++id) {
        REQUIRE(a.node(id).identity == b.node(id).identity);
    }
    REQUIRE(a.edges() == b.edges());
    REQUIRE(a.order() == b.order());
}

TEST_CASE("format_catalog drops relationship metaparameters", "[printer]") {
    auto c = compile(kSite);
    REQUIRE(c.is_ok());
    auto text = format_catalog(c.value());
    CHECK(text.find("require") == std::string::npos);
    CHECK(text.find("File['/tmp/two'] -> Service['nginx']") != std::string::npos);
    CHECK(text.find("Service['nginx'] -> Exec[\"/root/${scripts}/yo.sh\"]") !=
          std::string::npos);
    CHECK(text.find("service { 'nginx':\n  ensure => running,\n}") != std::string::npos);
}

TEST_CASE("to_dot lists nodes and styles notify edges", "[printer]") {
    auto c = compile("file { '/a': }\nservice { 's': }\nexec { 'e': }\n"
                     "File['/a'] ~> Service['s'] -> Exec['e']\n");
    REQUIRE(c.is_ok());
    auto dot = to_dot(c.value());
    CHECK(dot.find("digraph catalog {") == 0);
    CHECK(dot.find("  n0 [label=\"File['/a']\"];\n") != std::string::npos);
    CHECK(dot.find("  n0 -> n1 [style=dashed, label=\"notify\"];\n") != std::string::npos);
    CHECK(dot.find("  n1 -> n2;\n") != std::string::npos);
    CHECK(dot.back() == '\n');
}

TEST_CASE("to_dot escapes quotes in labels", "[printer]") {
    auto c = compile("exec { \"run ${cmd}\": }\n");
    REQUIRE(c.is_ok());
    auto dot = to_dot(c.value());
    CHECK(dot.find("[label=\"Exec[\\\"run ${cmd}\\\"]\"]") != std::string::npos);
}
