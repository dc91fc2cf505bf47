#pragma once

#include <weft/compiler.hpp>
#include <weft/log.hpp>
#include <weft/result.hpp>
#include <optional>
#include <string>

namespace weft {

enum class OutputFormat {
    Plan,      // application order with outgoing relationships
    Dot,       // Graphviz
    Manifest   // re-serialized declarations and edges
};

const char* output_format_name(OutputFormat f);
std::optional<OutputFormat> output_format_from_name(const std::string& name);

// Layered configuration: global > local
// Lower layers override higher layers (local wins over global)
struct Config {
    log::Level log_level = log::Info;
    bool color = false;
    CompileOptions compile;
    OutputFormat format = OutputFormat::Plan;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool color_set = false;
    bool collect_unresolved_set = false;
    bool format_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push log level and color settings into weft::log
    void apply_logging() const;
};

// Global config file path: ~/.weft/config.toml (empty if HOME is unset)
std::string global_config_path();

// Per-project config file, relative to the working directory
constexpr const char* kLocalConfigFile = "weft.toml";

} // namespace weft
