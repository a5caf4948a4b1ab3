#pragma once
#include "errors.hpp"
#include "parser.hpp"
#include "record.hpp"
#include "tag_map.hpp"
#include "writer.hpp"
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ris {

std::vector<Record> loads(std::string_view text, const ParserOptions& options = {});
std::vector<Record> load(std::istream& in, const ParserOptions& options = {});

/**
 * @brief Read and parse a file.
 * @param encoding "utf-8" (default), "utf-8-sig" or "latin-1"/"iso-8859-1".
 * @throws ConfigurationError for any other encoding.
 * @throws std::runtime_error if the file cannot be opened.
 */
std::vector<Record> load(const std::filesystem::path& path, std::string_view encoding = "utf-8",
                         const ParserOptions& options = {});

std::string dumps(const std::vector<Record>& records, const WriterOptions& options = {});
void dump(const std::vector<Record>& records, std::ostream& out, const WriterOptions& options = {});
void dump(const std::vector<Record>& records, const std::filesystem::path& path, const WriterOptions& options = {});

// Re-encodes text read in the given encoding as UTF-8.
std::string decode(std::string bytes, std::string_view encoding);

} // namespace ris
