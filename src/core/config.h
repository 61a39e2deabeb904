#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/error.h"

namespace core {

// ---------------------------------------------------------------------------
// Configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_CONFFILE        = "conf";
inline constexpr const char* CONF_MINIMUM_TTL     = "minimumttl";
inline constexpr const char* CONF_MAXIMUM_TTL     = "maximumttl";
inline constexpr const char* CONF_CACHE_SIZE      = "cachesize";
inline constexpr const char* CONF_RATE_REQUESTS   = "ratelimitrequests";
inline constexpr const char* CONF_RATE_WINDOW     = "ratelimitwindow";
inline constexpr const char* CONF_RATE_IDLE       = "ratelimitidle";
inline constexpr const char* CONF_RATE_MAX_IPS    = "ratelimitmaxips";
inline constexpr const char* CONF_REFRESH_THREADS = "refreshthreads";
inline constexpr const char* CONF_REFRESH_QUEUE   = "refreshqueue";
inline constexpr const char* CONF_RESOLVER        = "resolver";
inline constexpr const char* CONF_LOGLEVEL        = "loglevel";
inline constexpr const char* CONF_DEBUG           = "debug";
inline constexpr const char* CONF_LOGFILE         = "logfile";
inline constexpr const char* CONF_PRINTTOCONSOLE  = "printtoconsole";

// ---------------------------------------------------------------------------
// Config  --  hierarchical configuration with multiple sources
//
// Priority order: command-line args  >  config file  >  programmatic defaults
// Multi-value keys (e.g. -resolver=a -resolver=b) are accumulated into a
// vector accessible via get_list().
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    // -- source loading -----------------------------------------------------

    /// Parse command-line arguments.
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    /// Positional arguments are collected in order and available through
    /// positional().
    void parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style configuration file.
    /// Format per line:  key=value
    /// Lines starting with '#' and blank lines are ignored.
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    // -- setters / getters --------------------------------------------------

    /// Set a key to a single value (replaces any previous values).
    void set(std::string_view key, std::string value);

    /// Return the first value for @p key, or std::nullopt if absent.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    /// Return the first value for @p key, or @p default_val if absent.
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Return the value for @p key parsed as int64, or @p default_val.
    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Return the value for @p key parsed as bool, or @p default_val.
    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Return all values associated with @p key (multi-value support).
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    /// Check whether @p key exists in any source.
    [[nodiscard]] bool has(std::string_view key) const;

    [[nodiscard]] const std::vector<std::string>& positional() const noexcept {
        return positional_;
    }

private:
    // Two separate maps so that CLI args always override file values.
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;
    std::vector<std::string> positional_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
