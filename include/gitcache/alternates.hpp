#pragma once

#include <gitcache/repo.hpp>
#include <gitcache/result.hpp>
#include <cstdint>
#include <string>

namespace gitcache {

// Append `objects_dir` to the working copy's alternates file unless an
// identical line is already live. Returns true if a line was written.
Result<bool> append_alternate(const WorkingCopy& wc, const std::string& objects_dir);

// Back up the alternates file to alternates.<stamp>, then blank every
// line equal to `objects_dir` in place. Returns the number of lines
// blanked. A missing alternates file is left alone.
Result<size_t> blank_alternate(const WorkingCopy& wc, const std::string& objects_dir,
                               int64_t stamp);

// Number of live lines equal to `objects_dir`
Result<size_t> count_alternate(const WorkingCopy& wc, const std::string& objects_dir);

} // namespace gitcache
