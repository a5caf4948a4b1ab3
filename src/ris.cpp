#include "ris.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ris {

namespace {

std::string readAll(std::istream& in)
{
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string lowercase(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Every ISO-8859-1 byte is the code point of the same value.
std::string latin1ToUtf8(const std::string& bytes)
{
    std::string out;
    out.reserve(bytes.size());
    for (char ch : bytes) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out += ch;
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

} // namespace

std::string decode(std::string bytes, std::string_view encoding)
{
    const std::string name = lowercase(encoding);
    if (name == "utf-8" || name == "utf8" || name == "utf-8-sig" || name == "utf_8")
        return bytes;
    if (name == "latin-1" || name == "latin1" || name == "iso-8859-1" || name == "iso8859-1")
        return latin1ToUtf8(bytes);
    throw ConfigurationError("Unsupported encoding: " + std::string(encoding));
}

std::vector<Record> loads(std::string_view text, const ParserOptions& options)
{
    return Parser(options).parse(text);
}

std::vector<Record> load(std::istream& in, const ParserOptions& options)
{
    return loads(readAll(in), options);
}

std::vector<Record> load(const std::filesystem::path& path, std::string_view encoding, const ParserOptions& options)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path.string());
    }
    return loads(decode(readAll(file), encoding), options);
}

std::string dumps(const std::vector<Record>& records, const WriterOptions& options)
{
    return Writer(options).write(records);
}

void dump(const std::vector<Record>& records, std::ostream& out, const WriterOptions& options)
{
    Writer(options).write(records, out);
}

void dump(const std::vector<Record>& records, const std::filesystem::path& path, const WriterOptions& options)
{
    // nothing is written unless every record formats
    const std::string text = dumps(records, options);
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + path.string());
    }
    file << text;
}

} // namespace ris
