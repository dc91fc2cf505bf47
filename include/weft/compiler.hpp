#pragma once

#include <weft/catalog.hpp>
#include <weft/lang/ast.hpp>
#include <weft/result.hpp>
#include <string>

namespace weft {

struct CompileOptions {
    // See ResolveOptions::collect_unresolved
    bool collect_unresolved = true;
};

// Lex + parse only
Result<Manifest> parse_manifest(const std::string& source,
                                const std::string& filename = "<input>");

// Registry, relationship resolution and graph build for a parsed manifest
Result<Catalog> compile_manifest(const Manifest& manifest,
                                 const CompileOptions& options = {});

// Full pipeline: source text -> validated catalog. Each call is independent;
// concurrent calls share no state besides the log settings.
Result<Catalog> compile(const std::string& source,
                        const std::string& filename = "<input>",
                        const CompileOptions& options = {});

Result<Catalog> compile_file(const std::string& path,
                             const CompileOptions& options = {});

} // namespace weft
