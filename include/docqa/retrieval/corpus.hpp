#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "docqa/core/error.hpp"
#include "docqa/retrieval/types.hpp"

namespace docqa::retrieval {

/// Loads the JSONL corpus snapshot written by the indexer: one
/// `{"text": ..., "metadata": {...}}` object per line.
///
/// Records with empty text are skipped. A missing file, an unparseable line
/// or a snapshot without usable records fails with IndexUnavailable.
auto load_corpus(const std::filesystem::path& path) -> Result<std::vector<Chunk>>;

/// Same as load_corpus but reads from an already open stream. `origin` is
/// only used in log and error messages.
auto parse_corpus(std::istream& in, const std::string& origin)
    -> Result<std::vector<Chunk>>;

/// Builds a Chunk from one snapshot record. Returns NotFound when the record
/// has no usable text.
auto chunk_from_record(const json& record, size_t line_number) -> Result<Chunk>;

} // namespace docqa::retrieval
