// weft-plan: compile a manifest and print its application plan.
//
//     ./weft-plan site.pp                     # plan (order + relationships)
//     ./weft-plan site.pp --format dot        # Graphviz, pipe into `dot -Tsvg`
//     ./weft-plan site.pp --format manifest   # re-serialized catalog
//     ./weft-plan site.pp --tokens            # token dump before compiling
//
// Settings come from ~/.weft/config.toml, then ./weft.toml; flags win.

#include <weft/config.hpp>
#include <weft/lang/lexer.hpp>
#include <weft/printer.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using namespace weft;

static std::optional<Config> load_layer(const std::string& path) {
    if (path.empty() || !fs::exists(path)) return std::nullopt;
    auto cfg = Config::load(path);
    if (cfg.is_err()) {
        log::warn("ignoring config %s", path.c_str());
        log::report(cfg.error());
        return std::nullopt;
    }
    log::debug("loaded config %s", path.c_str());
    return std::move(cfg).value();
}

static void print_plan(const Catalog& catalog) {
    std::cout << "# " << catalog.size() << " resources, "
              << catalog.edges().size() << " relationships\n";
    size_t step = 1;
    for (NodeId id : catalog.order()) {
        std::cout << step++ << ". " << catalog.node(id).identity.str();
        for (const auto& e : catalog.edges_from(id)) {
            std::cout << " (" << edge_kind_name(e.kind) << " "
                      << catalog.node(e.target).identity.str() << ")";
        }
        std::cout << "\n";
    }
}

static int dump_tokens(const std::string& source, const std::string& path) {
    auto lr = lex(source, path);
    if (lr.is_err()) {
        log::report(lr.error());
        return 1;
    }
    std::cout << "-- Tokens --\n";
    for (const auto& t : lr.value().tokens) {
        std::cout << "  " << t.pos.line << ":" << t.pos.col
                  << "  " << token_name(t.type)
                  << "  \"" << t.text << "\"";
        for (const auto& span : t.spans) {
            std::cout << "  ${" << span.variable << "}@" << span.offset;
        }
        std::cout << "\n";
    }
    std::cout << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: weft-plan <manifest.pp> [--tokens] "
                     "[--format plan|dot|manifest]\n";
        return 1;
    }

    auto config = Config::effective(load_layer(global_config_path()),
                                    load_layer(kLocalConfigFile));

    std::string path = argv[1];
    bool show_tokens = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--tokens") {
            show_tokens = true;
        } else if (arg == "--format" && i + 1 < argc) {
            auto fmt = output_format_from_name(argv[++i]);
            if (!fmt) {
                log::report(WeftError{WeftError::InvalidArg,
                    std::string("unknown format '") + argv[i] + "'",
                    "expected one of: plan, dot, manifest"});
                return 1;
            }
            config.format = *fmt;
        } else {
            log::report(WeftError{WeftError::InvalidArg,
                "unexpected argument '" + arg + "'"});
            return 1;
        }
    }
    config.apply_logging();

    std::ifstream f(path);
    if (!f) {
        log::report(WeftError{WeftError::IO, "cannot open " + path});
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string source = ss.str();

    if (show_tokens && dump_tokens(source, path) != 0) return 1;

    auto result = compile(source, path, config.compile);
    if (result.is_err()) {
        log::report(result.error());
        return 1;
    }

    const auto& catalog = result.value();
    switch (config.format) {
    case OutputFormat::Plan:     print_plan(catalog); break;
    case OutputFormat::Dot:      std::cout << to_dot(catalog); break;
    case OutputFormat::Manifest: std::cout << format_catalog(catalog); break;
    }
    return 0;
}
