#include <weft/compiler.hpp>
#include <weft/lang/lexer.hpp>
#include <weft/lang/parser.hpp>
#include <weft/log.hpp>
#include <fstream>
#include <sstream>

namespace weft {

Result<Manifest> parse_manifest(const std::string& source,
                                const std::string& filename) {
    auto lr = lex(source, filename);
    if (lr.is_err()) return std::move(lr).error();
    log::debug("%s: %zu tokens, %zu comments", filename.c_str(),
               lr.value().tokens.size(), lr.value().comments.size());

    auto pr = parse(lr.value());
    if (pr.is_err()) return std::move(pr).error();
    log::debug("%s: %zu declarations, %zu relationship chains", filename.c_str(),
               pr.value().resources.size(), pr.value().chains.size());
    return pr;
}

Result<Catalog> compile_manifest(const Manifest& manifest,
                                 const CompileOptions& options) {
    auto registry = register_resources(manifest);
    if (registry.is_err()) return std::move(registry).error();

    ResolveOptions resolve_opts;
    resolve_opts.collect_unresolved = options.collect_unresolved;
    auto edges = resolve_relationships(manifest, registry.value(), resolve_opts);
    if (edges.is_err()) return std::move(edges).error();

    return build_catalog(std::move(registry).value(), std::move(edges).value());
}

Result<Catalog> compile(const std::string& source,
                        const std::string& filename,
                        const CompileOptions& options) {
    auto manifest = parse_manifest(source, filename);
    if (manifest.is_err()) return std::move(manifest).error();
    return compile_manifest(manifest.value(), options);
}

Result<Catalog> compile_file(const std::string& path,
                             const CompileOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return WeftError{WeftError::IO,
            "cannot open manifest: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return compile(ss.str(), path, options);
}

} // namespace weft
