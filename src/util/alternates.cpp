#include <gitcache/alternates.hpp>
#include <gitcache/log.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace gitcache {

// Lines written by `clone --reference` are resolved through symlinks,
// lines written by append_alternate() are not; compare canonical forms
static std::string canonical_dir(const std::string& dir) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(fs::path(dir), ec);
    std::string s = ec ? fs::path(dir).lexically_normal().string() : p.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

static bool same_dir(const std::string& line, const std::string& objects_dir) {
    if (line.empty()) return false;
    if (line == objects_dir) return true;
    return canonical_dir(line) == canonical_dir(objects_dir);
}

static Result<std::vector<std::string>> read_lines(const fs::path& path) {
    std::vector<std::string> lines;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::vector<std::string>>::ok(std::move(lines));
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return GitcacheError{GitcacheError::IO,
            "cannot read alternates file: " + path.string()};
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return Result<std::vector<std::string>>::ok(std::move(lines));
}

Result<size_t> count_alternate(const WorkingCopy& wc, const std::string& objects_dir) {
    auto lines = read_lines(wc.alternates_path());
    if (lines.is_err()) return std::move(lines).error();

    size_t n = 0;
    for (const auto& line : lines.value()) {
        if (same_dir(line, objects_dir)) n++;
    }
    return Result<size_t>::ok(n);
}

Result<bool> append_alternate(const WorkingCopy& wc, const std::string& objects_dir) {
    auto live = count_alternate(wc, objects_dir);
    if (live.is_err()) return std::move(live).error();
    if (live.value() > 0) {
        log::debug("alternates already reference %s", objects_dir.c_str());
        return Result<bool>::ok(false);
    }

    fs::path path = wc.alternates_path();
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return GitcacheError{GitcacheError::IO,
            "cannot create " + path.parent_path().string() + ": " + ec.message()};
    }

    // Make sure the new entry starts on its own line
    bool needs_newline = false;
    if (fs::exists(path, ec) && fs::file_size(path, ec) > 0) {
        std::ifstream in(path, std::ios::binary);
        in.seekg(-1, std::ios::end);
        char last = '\n';
        in.get(last);
        needs_newline = last != '\n';
    }

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return GitcacheError{GitcacheError::IO,
            "cannot write alternates file: " + path.string()};
    }
    if (needs_newline) out << '\n';
    out << objects_dir << '\n';
    out.close();
    if (!out) {
        return GitcacheError{GitcacheError::IO,
            "failed writing alternates file: " + path.string()};
    }

    log::debug("appended %s to %s", objects_dir.c_str(), path.c_str());
    return Result<bool>::ok(true);
}

Result<size_t> blank_alternate(const WorkingCopy& wc, const std::string& objects_dir,
                               int64_t stamp) {
    fs::path path = wc.alternates_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        log::debug("no alternates file in %s", wc.git_dir.c_str());
        return Result<size_t>::ok(0);
    }

    auto lines = read_lines(path);
    if (lines.is_err()) return std::move(lines).error();

    fs::path backup = path;
    backup += "." + std::to_string(stamp);
    fs::copy_file(path, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return GitcacheError{GitcacheError::IO,
            "cannot back up " + path.string() + ": " + ec.message()};
    }

    size_t blanked = 0;
    std::ostringstream rewritten;
    for (const auto& line : lines.value()) {
        if (same_dir(line, objects_dir)) {
            blanked++;
            rewritten << '\n';
        } else {
            rewritten << line << '\n';
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return GitcacheError{GitcacheError::IO,
            "cannot rewrite alternates file: " + path.string()};
    }
    out << rewritten.str();
    out.close();
    if (!out) {
        return GitcacheError{GitcacheError::IO,
            "failed rewriting alternates file: " + path.string()};
    }

    log::debug("blanked %zu line(s) in %s, backup %s",
               blanked, path.c_str(), backup.c_str());
    return Result<size_t>::ok(blanked);
}

} // namespace gitcache
