#pragma once

#include <gitcache/result.hpp>
#include <string>
#include <vector>

namespace gitcache {

// Structural fields of a remote repository URL.
//
// Accepted shapes:
//   <scheme>://[<user>@]<host>[:<port>]/[<path>/]<project>[.git]
//   [<user>@]<host>:[<path>/]<project>[.git]          (scp-like)
//
// Absent optional fields are empty. `domain` and `project` are always
// non-empty in a successfully parsed URL.
struct RepoUrl {
    std::string address;   // the URL as given, suitable for cloning
    std::string protocol;  // "https", "ssh", ... ; empty for scp-like
    std::string user;
    std::string domain;
    std::string port;
    std::string path;      // between host and project, no surrounding '/'
    std::string project;   // last path component without ".git"

    // Parse a single URL token
    static Result<RepoUrl> parse(const std::string& text);

    // First argument that parses as a URL; options (leading '-') are
    // skipped. Lets callers hand over a whole clone command line.
    static Result<RepoUrl> find_in(const std::vector<std::string>& args);

    // Whitespace-separated variant of find_in()
    static Result<RepoUrl> search(const std::string& line);
};

} // namespace gitcache
