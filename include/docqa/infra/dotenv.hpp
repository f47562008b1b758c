#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace docqa::infra {

/// Parses a .env file and returns a map of key-value pairs.
/// Supports:
///   - KEY=VALUE
///   - KEY="VALUE" (double-quoted, with escape sequences and ${VAR} expansion)
///   - KEY='VALUE' (single-quoted, literal)
///   - # comments (full-line and inline after unquoted values)
///   - export KEY=VALUE (optional export prefix)
/// ${VAR} references resolve against keys defined earlier in the same file
/// first, then the process environment.
auto parse_env_file(const std::filesystem::path& path)
    -> std::unordered_map<std::string, std::string>;

/// Loads a .env file into the process environment. A missing file is not an
/// error. Existing variables are kept unless `overwrite` is true.
/// Returns the number of variables that were set.
auto load_env_file(const std::filesystem::path& path, bool overwrite = false)
    -> std::size_t;

} // namespace docqa::infra
