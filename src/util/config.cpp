#include <weft/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace weft {

const char* output_format_name(OutputFormat f) {
    switch (f) {
    case OutputFormat::Plan:     return "plan";
    case OutputFormat::Dot:      return "dot";
    case OutputFormat::Manifest: return "manifest";
    }
    return "?";
}

std::optional<OutputFormat> output_format_from_name(const std::string& name) {
    for (auto f : {OutputFormat::Plan, OutputFormat::Dot, OutputFormat::Manifest}) {
        if (name == output_format_name(f)) return f;
    }
    return std::nullopt;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return WeftError{WeftError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column)};
    }

    Config cfg;

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        if (auto v = (*log_tbl)["level"].value<std::string>()) {
            auto lvl = log::level_from_name(*v);
            if (!lvl) {
                return WeftError{WeftError::Config,
                    "unknown log level '" + *v + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
            cfg.log_level_set = true;
        }
        if (auto v = (*log_tbl)["color"].value<bool>()) {
            cfg.color = *v;
            cfg.color_set = true;
        }
    }

    // [compile] section
    if (auto compile_tbl = doc["compile"].as_table()) {
        if (auto v = (*compile_tbl)["collect-unresolved"].value<bool>()) {
            cfg.compile.collect_unresolved = *v;
            cfg.collect_unresolved_set = true;
        }
    }

    // [output] section
    if (auto output_tbl = doc["output"].as_table()) {
        if (auto v = (*output_tbl)["format"].value<std::string>()) {
            auto fmt = output_format_from_name(*v);
            if (!fmt) {
                return WeftError{WeftError::Config,
                    "unknown output format '" + *v + "'",
                    "expected one of: plan, dot, manifest"};
            }
            cfg.format = *fmt;
            cfg.format_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return WeftError{WeftError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err() && cfg.error().file.empty()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
    if (other.collect_unresolved_set) {
        compile.collect_unresolved = other.compile.collect_unresolved;
        collect_unresolved_set = true;
    }
    if (other.format_set) {
        format = other.format;
        format_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (color_set) log::set_color_enabled(color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.weft/config.toml";
}

} // namespace weft
