#pragma once

#include <gitcache/result.hpp>
#include <gitcache/log.hpp>
#include <functional>
#include <string>

namespace gitcache {

// Environment lookup, std::getenv by default. Tests substitute a map.
using EnvLookup = std::function<const char*(const char*)>;

// Layered settings: defaults < config file < environment
struct Settings {
    std::string cache_root;
    std::string git_program = "git";
    std::string default_remote = "origin";
    int command_timeout = 0;           // seconds, 0 = unlimited
    log::Level log_level = log::Info;

    // Track which fields a layer set explicitly (for merge)
    bool cache_root_set = false;
    bool git_program_set = false;
    bool default_remote_set = false;
    bool command_timeout_set = false;
    bool log_level_set = false;

    // Built-in defaults relative to the given home directory
    static Settings defaults(const std::string& home);

    // Parse from TOML string
    static Result<Settings> parse(const std::string& toml_str);

    // Load a TOML config file
    static Result<Settings> load(const std::string& path);

    // Overlay explicitly-set fields of `other`
    void merge(const Settings& other);

    // GIT_CACHE_DIR and GIT_CACHE_LOG
    Status apply_env(const EnvLookup& env);

    // defaults -> config file (if present) -> environment
    static Result<Settings> resolve(const EnvLookup& env);
};

// Config file path: $GIT_CACHE_CONFIG, else ~/.config/git-cache/config.toml
std::string config_file_path(const EnvLookup& env);

// Expand a leading "~/" against `home`
std::string expand_home(const std::string& path, const std::string& home);

} // namespace gitcache
