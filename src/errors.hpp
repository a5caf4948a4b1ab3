#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

namespace ris {

// Invalid mapping/list-tag configuration. Raised at construction or first use, never mid-parse.
struct ConfigurationError : std::runtime_error {
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Malformed input, with the 0-based line number and the offending line.
 */
class ParseError : public std::runtime_error
{
    std::size_t lineNumber;
    std::string lineText;

public:
    ParseError(const std::string& reason, std::size_t line, const std::string& text)
        : std::runtime_error(reason + " in line " + std::to_string(line) + ":\n " + text),
          lineNumber(line), lineText(text) {}

    std::size_t line() const { return lineNumber; }
    const std::string& text() const { return lineText; }
};

} // namespace ris
