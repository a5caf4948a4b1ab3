#pragma once
#include "errors.hpp"
#include "line_format.hpp"
#include "record.hpp"
#include "tag_map.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ris {

// What happens when the input ends inside a record of a dialect that has an end tag.
enum class MissingEndPolicy
{
    DISCARD, // drop the incomplete record
    ERROR,   // throw ParseError
};

struct ParserOptions {
    Dialect dialect = Dialect::RIS;
    TagConfig tags;
    // Fields whose entries may pack several addresses separated by ';'. Defaults to {"urls"}.
    std::optional<std::set<std::string>> urlFields;
    bool skipUnknownTags = false;
    bool enforceListTags = true;
    bool skipMissingTags = false;
    MissingEndPolicy missingEnd = MissingEndPolicy::DISCARD;
};

/**
 * @brief Scratch state of one parse call. Never shared between calls.
 */
struct ParseSession {
    enum class Target
    {
        NONE,    // nothing written yet in this record
        FIELD,   // a mapped tag
        UNKNOWN, // an entry of the unknown-tag container
        IGNORED, // continuation lines are dropped with the tag
    };

    bool inRecord = false;
    Record current;
    Target last = Target::NONE;
    std::string lastTag;

    void reset()
    {
        inRecord = false;
        current = Record{};
        last = Target::NONE;
        lastTag.clear();
    }
};

struct Skip {};
struct Emit {
    Record record;
};
using Step = std::variant<Skip, Emit, ParseError>;

class RecordReader;

class Parser
{
    ParserOptions options;
    TagMap tags;
    std::shared_ptr<const LineFormat> format;
    std::set<std::string> urlFields;

    Step processTag(ParseSession& session, std::string_view line, size_t lineNumber) const;
    Step processContinuation(ParseSession& session, std::string_view line, size_t lineNumber) const;

    void addTag(ParseSession& session, const std::string& tag, const std::string& value, bool continuation) const;
    void addUnknownTag(ParseSession& session, const std::string& tag, std::string value) const;
    void extendUnknownTag(ParseSession& session, std::string_view value) const;
    Record finishRecord(ParseSession& session) const;
    void finalizeRecord(Record& record) const;

public:
    // Throws ConfigurationError when the mapping lacks the start tag, or lacks "UK" while unknown tags are kept.
    explicit Parser(ParserOptions opts = {});

    std::vector<Record> parse(std::string_view text) const;
    // The parser must outlive the reader.
    RecordReader reader(std::string text) const;

    // One line of input; blank lines must be filtered by the caller.
    Step processLine(ParseSession& session, std::string_view line, size_t lineNumber) const;
    // End of input.
    Step finish(ParseSession& session, size_t lineNumber) const;

    const TagMap& tagMap() const { return tags; }
    const LineFormat& lineFormat() const { return *format; }
    const ParserOptions& config() const { return options; }
};

/**
 * @brief Single-pass sequence of records over one input text.
 *
 * Records are produced one at a time; each one is complete when returned.
 * A ParseError thrown by next() ends the sequence, records returned before it stay valid.
 */
class RecordReader
{
    const Parser& parser;
    std::string source;
    size_t cursor = 0;
    size_t lineNumber = 0;
    bool done = false;
    ParseSession session;

    std::optional<std::string_view> nextLine();

public:
    RecordReader(const Parser& p, std::string text);

    std::optional<Record> next();
};

// Removes any leading UTF-8 byte order marks.
std::string_view stripBom(std::string_view text);

} // namespace ris
