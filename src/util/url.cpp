#include <gitcache/url.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace gitcache {

static bool is_scheme(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '.' || c == '-';
    });
}

static bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}

static GitcacheError url_error(const std::string& text, const std::string& why) {
    return GitcacheError{GitcacheError::Parse,
        "cannot parse repository URL '" + text + "': " + why,
        "expected scheme://[user@]host[:port]/path/project.git or user@host:path/project.git"};
}

// Split "[user@]host" into its parts
static void split_user(const std::string& authority, std::string& user, std::string& host) {
    auto at = authority.rfind('@');
    if (at == std::string::npos) {
        host = authority;
    } else {
        user = authority.substr(0, at);
        host = authority.substr(at + 1);
    }
}

// "[::1]" -> "::1"; other hosts unchanged
static std::string unbracket(const std::string& host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

// Split "path/to/project.git" into path and project
static void split_project(std::string rest, std::string& path, std::string& project) {
    while (!rest.empty() && rest.front() == '/') rest.erase(0, 1);

    auto slash = rest.rfind('/');
    if (slash == std::string::npos) {
        project = rest;
    } else {
        path = rest.substr(0, slash);
        project = rest.substr(slash + 1);
    }

    const std::string suffix = ".git";
    if (project.size() > suffix.size() &&
        project.compare(project.size() - suffix.size(), suffix.size(), suffix) == 0) {
        project.erase(project.size() - suffix.size());
    }
}

Result<RepoUrl> RepoUrl::parse(const std::string& text) {
    RepoUrl url;

    std::string s = text;
    while (!s.empty() && s.back() == '/') s.pop_back();
    if (s.empty()) return url_error(text, "empty");
    url.address = s;

    std::string rest;
    auto scheme_end = s.find("://");
    if (scheme_end != std::string::npos && is_scheme(s.substr(0, scheme_end))) {
        url.protocol = s.substr(0, scheme_end);
        std::string after = s.substr(scheme_end + 3);

        auto slash = after.find('/');
        if (slash == std::string::npos) return url_error(text, "no project path");

        std::string host_port;
        split_user(after.substr(0, slash), url.user, host_port);

        // The port colon comes after a bracketed IPv6 literal
        size_t port_from = 0;
        if (!host_port.empty() && host_port[0] == '[') {
            auto close = host_port.find(']');
            if (close == std::string::npos) return url_error(text, "unterminated '[' in host");
            if (close + 1 < host_port.size() && host_port[close + 1] != ':') {
                return url_error(text, "unexpected text after ']' in host");
            }
            port_from = close;
        }

        auto colon = host_port.find(':', port_from);
        if (colon == std::string::npos) {
            url.domain = host_port;
        } else {
            url.domain = host_port.substr(0, colon);
            url.port = host_port.substr(colon + 1);
            if (!url.port.empty() && !is_digits(url.port)) {
                return url_error(text, "port '" + url.port + "' is not numeric");
            }
        }
        rest = after.substr(slash + 1);
    } else {
        // scp-like syntax is only recognized when no '/' precedes the ':'
        size_t colon_from = 0;
        auto open = s.find('[');
        if (open != std::string::npos && open < s.find(':')) {
            auto close = s.find(']', open);
            if (close == std::string::npos) return url_error(text, "unterminated '[' in host");
            colon_from = close;
        }
        auto colon = s.find(':', colon_from);
        auto slash = s.find('/');
        if (colon == std::string::npos || (slash != std::string::npos && slash < colon)) {
            return url_error(text, "not a remote URL");
        }
        split_user(s.substr(0, colon), url.user, url.domain);
        rest = s.substr(colon + 1);
    }

    url.domain = unbracket(url.domain);
    if (url.domain.empty()) return url_error(text, "no domain");
    if (url.domain.find_first_of(" \t=") != std::string::npos) {
        return url_error(text, "invalid domain '" + url.domain + "'");
    }

    split_project(rest, url.path, url.project);
    if (url.project.empty()) return url_error(text, "no project name");

    return Result<RepoUrl>::ok(std::move(url));
}

Result<RepoUrl> RepoUrl::find_in(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (arg.empty() || arg[0] == '-') continue;
        auto r = parse(arg);
        if (r.is_ok()) return r;
    }

    std::string joined;
    for (const auto& a : args) {
        if (!joined.empty()) joined += ' ';
        joined += a;
    }
    return GitcacheError{GitcacheError::Parse,
        "cannot determine repository domain from '" + joined + "'",
        "pass a URL such as https://host/group/project.git or git@host:group/project.git"};
}

Result<RepoUrl> RepoUrl::search(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (stream >> tok) tokens.push_back(tok);
    return find_in(tokens);
}

} // namespace gitcache
