#include <gitcache/config.hpp>
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace gitcache {

static std::string home_dir(const EnvLookup& env) {
    const char* home = env("HOME");
    if (!home || !*home) home = "/tmp";
    return home;
}

std::string expand_home(const std::string& path, const std::string& home) {
    if (path == "~") return home;
    if (path.rfind("~/", 0) == 0) return home + path.substr(1);
    return path;
}

Settings Settings::defaults(const std::string& home) {
    Settings s;
    s.cache_root = home + "/.cache/git-cache";
    return s;
}

Result<Settings> Settings::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return GitcacheError{GitcacheError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Settings cfg;

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["root"].value<std::string>()) {
            if (v->empty()) {
                return GitcacheError{GitcacheError::Config, "cache.root must not be empty"};
            }
            cfg.cache_root = *v;
            cfg.cache_root_set = true;
        }
        if (auto v = (*cache)["remote"].value<std::string>()) {
            if (v->empty()) {
                return GitcacheError{GitcacheError::Config, "cache.remote must not be empty"};
            }
            cfg.default_remote = *v;
            cfg.default_remote_set = true;
        }
    }

    // [git] section
    if (auto git = doc["git"].as_table()) {
        if (auto v = (*git)["program"].value<std::string>()) {
            if (v->empty()) {
                return GitcacheError{GitcacheError::Config, "git.program must not be empty"};
            }
            cfg.git_program = *v;
            cfg.git_program_set = true;
        }
        if (auto v = (*git)["timeout"].value<int64_t>()) {
            if (*v < 0) {
                return GitcacheError{GitcacheError::Config,
                    "git.timeout must be >= 0, got " + std::to_string(*v)};
            }
            cfg.command_timeout = static_cast<int>(*v);
            cfg.command_timeout_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return GitcacheError{GitcacheError::Config,
                    "unknown log.level '" + *v + "'",
                    "use one of trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
    }

    return Result<Settings>::ok(std::move(cfg));
}

Result<Settings> Settings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return GitcacheError{GitcacheError::NotFound,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = Settings::parse(ss.str());
    if (r.is_err()) {
        auto err = std::move(r).error();
        err.file = path;
        return err;
    }
    return r;
}

void Settings::merge(const Settings& other) {
    if (other.cache_root_set) {
        cache_root = other.cache_root;
        cache_root_set = true;
    }
    if (other.git_program_set) {
        git_program = other.git_program;
        git_program_set = true;
    }
    if (other.default_remote_set) {
        default_remote = other.default_remote;
        default_remote_set = true;
    }
    if (other.command_timeout_set) {
        command_timeout = other.command_timeout;
        command_timeout_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
}

Status Settings::apply_env(const EnvLookup& env) {
    if (const char* dir = env("GIT_CACHE_DIR")) {
        if (*dir) {
            cache_root = dir;
            cache_root_set = true;
        }
    }
    if (const char* lvl = env("GIT_CACHE_LOG")) {
        if (*lvl) {
            if (!log::parse_level(lvl, log_level)) {
                return GitcacheError{GitcacheError::Config,
                    std::string("unknown GIT_CACHE_LOG level '") + lvl + "'",
                    "use one of trace, debug, info, warn, error"};
            }
            log_level_set = true;
        }
    }
    return ok_status();
}

Result<Settings> Settings::resolve(const EnvLookup& env) {
    std::string home = home_dir(env);
    Settings result = Settings::defaults(home);

    std::string path = config_file_path(env);
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        auto file = Settings::load(path);
        if (file.is_err()) return std::move(file).error();
        result.merge(file.value());
    }

    GITCACHE_TRY(result.apply_env(env));
    result.cache_root = expand_home(result.cache_root, home);
    return Result<Settings>::ok(std::move(result));
}

std::string config_file_path(const EnvLookup& env) {
    if (const char* p = env("GIT_CACHE_CONFIG")) {
        if (*p) return p;
    }
    return home_dir(env) + "/.config/git-cache/config.toml";
}

} // namespace gitcache
