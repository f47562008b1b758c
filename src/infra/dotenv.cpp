#include "docqa/infra/dotenv.hpp"
#include "docqa/core/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <string_view>

namespace docqa::infra {

namespace {

auto trim_view(std::string_view s) -> std::string_view {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

auto unescape_double_quoted(std::string_view body) -> std::string {
    std::string value;
    for (size_t pos = 0; pos < body.size(); ++pos) {
        char c = body[pos];
        if (c == '"') break;
        if (c == '\\' && pos + 1 < body.size()) {
            char next = body[++pos];
            switch (next) {
                case 'n':  value += '\n'; break;
                case 'r':  value += '\r'; break;
                case 't':  value += '\t'; break;
                case '\\': value += '\\'; break;
                case '"':  value += '"';  break;
                default:
                    value += '\\';
                    value += next;
                    break;
            }
        } else {
            value += c;
        }
    }
    return value;
}

auto expand_refs(std::string_view value,
                 const std::unordered_map<std::string, std::string>& defined)
    -> std::string {
    std::string out;
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
            auto close = value.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string name(value.substr(i + 2, close - i - 2));
                if (auto it = defined.find(name); it != defined.end()) {
                    out += it->second;
                } else if (auto* env = std::getenv(name.c_str())) {
                    out += env;
                }
                i = close + 1;
                continue;
            }
        }
        out += value[i++];
    }
    return out;
}

} // anonymous namespace

auto parse_env_file(const std::filesystem::path& path)
    -> std::unordered_map<std::string, std::string> {
    std::unordered_map<std::string, std::string> env_map;

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_DEBUG("No .env file at {}", path.string());
        return env_map;
    }

    std::string raw_line;
    int line_number = 0;

    while (std::getline(file, raw_line)) {
        ++line_number;

        auto line = trim_view(raw_line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        if (line.starts_with("export ")) {
            line = trim_view(line.substr(7));
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos) {
            LOG_WARN("{}:{}: Skipping malformed line (no '=')", path.string(), line_number);
            continue;
        }

        auto key = std::string(trim_view(line.substr(0, eq_pos)));
        if (key.empty()) {
            LOG_WARN("{}:{}: Skipping line with empty key", path.string(), line_number);
            continue;
        }

        auto raw_value = trim_view(line.substr(eq_pos + 1));
        std::string value;

        if (!raw_value.empty() && raw_value.front() == '\'') {
            auto body = raw_value.substr(1);
            value = std::string(body.substr(0, body.find('\'')));
        } else if (!raw_value.empty() && raw_value.front() == '"') {
            value = expand_refs(unescape_double_quoted(raw_value.substr(1)), env_map);
        } else {
            auto comment_pos = raw_value.find(" #");
            if (comment_pos != std::string_view::npos) {
                raw_value = trim_view(raw_value.substr(0, comment_pos));
            }
            value = expand_refs(raw_value, env_map);
        }

        env_map[std::move(key)] = std::move(value);
    }

    LOG_DEBUG("Parsed {} variables from {}", env_map.size(), path.string());
    return env_map;
}

auto load_env_file(const std::filesystem::path& path, bool overwrite) -> std::size_t {
    auto env_map = parse_env_file(path);
    std::size_t applied = 0;

    for (const auto& [key, value] : env_map) {
        if (!overwrite && std::getenv(key.c_str()) != nullptr) {
            LOG_TRACE("Skipping existing env var: {}", key);
            continue;
        }

        if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
            LOG_WARN("Failed to set env var: {}", key);
            continue;
        }
        ++applied;
    }

    if (!env_map.empty()) {
        LOG_INFO("Loaded {} variables from {}", applied, path.string());
    }
    return applied;
}

} // namespace docqa::infra
