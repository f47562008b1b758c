#include "docqa/retrieval/corpus.hpp"
#include "docqa/core/logger.hpp"
#include "docqa/core/utils.hpp"

#include <fstream>

namespace docqa::retrieval {

namespace {

auto string_field(const json& obj, const char* key) -> std::optional<std::string> {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

} // anonymous namespace

auto chunk_from_record(const json& record, size_t line_number) -> Result<Chunk> {
    if (!record.is_object()) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Corpus record is not an object",
            "line " + std::to_string(line_number)));
    }

    auto text = string_field(record, "text");
    if (!text) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Corpus record has no text",
            "line " + std::to_string(line_number)));
    }

    const json empty = json::object();
    const auto& metadata = record.contains("metadata") ? record["metadata"] : empty;

    Chunk chunk;
    chunk.text = std::move(*text);
    chunk.title = string_field(metadata, "title");
    chunk.source_path = string_field(metadata, "source_path");

    // The indexer prefers the crawled url and falls back to the file path.
    chunk.url = string_field(metadata, "url");
    if (!chunk.url) {
        chunk.url = chunk.source_path;
    }

    std::optional<std::string> chunk_index;
    if (metadata.is_object() && metadata.contains("chunk_id")) {
        const auto& cid = metadata["chunk_id"];
        if (cid.is_number_integer()) {
            chunk_index = std::to_string(cid.get<int64_t>());
        } else if (cid.is_string()) {
            chunk_index = cid.get<std::string>();
        }
    }

    if (chunk.source_path && chunk_index) {
        chunk.id = *chunk.source_path + "#" + *chunk_index;
    } else {
        chunk.id = "line:" + std::to_string(line_number);
    }

    return chunk;
}

auto parse_corpus(std::istream& in, const std::string& origin)
    -> Result<std::vector<Chunk>> {
    std::vector<Chunk> chunks;
    std::string line;
    size_t line_number = 0;
    size_t skipped = 0;

    while (std::getline(in, line)) {
        ++line_number;
        if (utils::trim(line).empty()) continue;

        json record;
        try {
            record = json::parse(line);
        } catch (const json::parse_error& e) {
            return std::unexpected(make_error(ErrorCode::IndexUnavailable,
                "Corpus snapshot is not valid JSONL",
                origin + ":" + std::to_string(line_number) + ": " + e.what()));
        }

        auto chunk = chunk_from_record(record, line_number);
        if (!chunk) {
            if (chunk.error().code() == ErrorCode::NotFound) {
                ++skipped;
                continue;
            }
            return std::unexpected(make_error(ErrorCode::IndexUnavailable,
                "Corpus snapshot contains an invalid record",
                origin + ": " + chunk.error().what()));
        }
        chunks.push_back(std::move(*chunk));
    }

    if (in.bad()) {
        return std::unexpected(make_error(ErrorCode::IndexUnavailable,
            "Failed reading corpus snapshot", origin));
    }

    if (skipped > 0) {
        LOG_WARN("Skipped {} corpus records without text in {}", skipped, origin);
    }

    if (chunks.empty()) {
        return std::unexpected(make_error(ErrorCode::IndexUnavailable,
            "Corpus snapshot has no usable records", origin));
    }

    LOG_INFO("Loaded {} chunks from {}", chunks.size(), origin);
    return chunks;
}

auto load_corpus(const std::filesystem::path& path) -> Result<std::vector<Chunk>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(make_error(ErrorCode::IndexUnavailable,
            "Corpus snapshot not found", path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IndexUnavailable,
            "Cannot open corpus snapshot", path.string()));
    }

    return parse_corpus(file, path.string());
}

} // namespace docqa::retrieval
