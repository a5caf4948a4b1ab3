#include "parser.hpp"
#include <iterator>
#include <utility>

namespace ris {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

ValueList splitTrimmed(std::string_view text, std::string_view delimiter)
{
    ValueList parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(trim(text.substr(start)));
            break;
        }
        parts.emplace_back(trim(text.substr(start, pos - start)));
        start = pos + delimiter.size();
    }
    return parts;
}

// A trailing ';' leaves no address behind it.
ValueList splitUrls(std::string_view text)
{
    ValueList urls = splitTrimmed(text, ";");
    if (urls.size() > 1 && urls.back().empty())
        urls.pop_back();
    return urls;
}

void appendValue(ValueList& list, FieldValue value)
{
    if (auto* more = std::get_if<ValueList>(&value)) {
        list.insert(list.end(), std::make_move_iterator(more->begin()), std::make_move_iterator(more->end()));
    } else {
        list.push_back(std::move(std::get<std::string>(value)));
    }
}

// Wrapped text is rejoined with a single space.
void joinWrapped(std::string& target, std::string_view more)
{
    if (target.empty()) {
        target = more;
        return;
    }
    target += ' ';
    target += more;
}

} // namespace

std::string_view stripBom(std::string_view text)
{
    while (text.starts_with(UTF8_BOM)) {
        text.remove_prefix(UTF8_BOM.size());
    }
    return text;
}

Parser::Parser(ParserOptions opts)
    : options(std::move(opts)),
      tags(TagMap::resolve(options.dialect, options.tags)),
      format(makeLineFormat(options.dialect)),
      urlFields(options.urlFields ? *options.urlFields : std::set<std::string>{"urls"})
{
    if (!tags.fieldName(format->startTag()))
        throw ConfigurationError("Mapping has no entry for the start tag " + std::string(format->startTag()));
    if (!options.skipUnknownTags && !tags.unknownFieldName())
        throw ConfigurationError("Mapping has no \"UK\" entry to hold unknown tags; "
                                 "add one or skip unknown tags");
}

std::vector<Record> Parser::parse(std::string_view text) const
{
    std::vector<Record> records;
    RecordReader stream = reader(std::string(text));
    while (auto record = stream.next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

RecordReader Parser::reader(std::string text) const
{
    return RecordReader(*this, std::move(text));
}

Step Parser::processLine(ParseSession& session, std::string_view line, size_t lineNumber) const
{
    if (format->classify(line) == LineKind::TAG)
        return processTag(session, line, lineNumber);
    return processContinuation(session, line, lineNumber);
}

Step Parser::processTag(ParseSession& session, std::string_view line, size_t lineNumber) const
{
    const std::string tag(format->tag(line));

    if (tags.isIgnored(tag)) {
        if (session.inRecord)
            session.last = ParseSession::Target::IGNORED;
        return Skip{};
    }

    const auto endTag = format->endTag();
    if (endTag && tag == *endTag) {
        // a stray end tag never produces an empty record
        if (!session.inRecord)
            return Skip{};
        return Emit{finishRecord(session)};
    }

    if (tag == format->startTag()) {
        if (session.inRecord) {
            if (endTag)
                return ParseError("Missing end of record tag", lineNumber, std::string(line));
            Record finished = finishRecord(session);
            addTag(session, tag, format->content(line), false);
            session.inRecord = true;
            return Emit{std::move(finished)};
        }
        addTag(session, tag, format->content(line), false);
        session.inRecord = true;
        return Skip{};
    }

    if (!session.inRecord) {
        if (format->isHeader(line))
            return Skip{};
        return ParseError("Invalid start tag", lineNumber, std::string(line));
    }

    // a literal UK line shares its field name with the unknown container
    if (tags.fieldName(tag) && tag != UNKNOWN_TAG) {
        addTag(session, tag, format->content(line), false);
    } else if (!options.skipUnknownTags) {
        addUnknownTag(session, tag, format->content(line));
    } else {
        session.last = ParseSession::Target::IGNORED;
    }
    return Skip{};
}

Step Parser::processContinuation(ParseSession& session, std::string_view line, size_t lineNumber) const
{
    if (options.skipMissingTags)
        return Skip{};

    if (!session.inRecord) {
        if (format->isHeader(line))
            return Skip{};
        return ParseError("Expected start tag", lineNumber, std::string(line));
    }

    switch (session.last)
    {
    case ParseSession::Target::NONE:
        return ParseError("Expected tag", lineNumber, std::string(line));
    case ParseSession::Target::IGNORED:
        break;
    case ParseSession::Target::UNKNOWN:
        extendUnknownTag(session, trim(line));
        break;
    case ParseSession::Target::FIELD:
        addTag(session, session.lastTag, std::string(trim(line)), true);
        break;
    }
    return Skip{};
}

Step Parser::finish(ParseSession& session, size_t lineNumber) const
{
    if (!session.inRecord)
        return Skip{};
    if (!format->endTag())
        return Emit{finishRecord(session)};
    if (options.missingEnd == MissingEndPolicy::ERROR)
        return ParseError("Missing end of record tag at end of input", lineNumber, "");
    session.reset();
    return Skip{};
}

void Parser::addTag(ParseSession& session, const std::string& tag, const std::string& content, bool continuation) const
{
    const std::string& name = *tags.fieldName(tag);
    session.last = ParseSession::Target::FIELD;
    session.lastTag = tag;

    FieldValue value = content;
    if (const auto* delimiter = tags.delimiter(tag))
        value = splitTrimmed(content, *delimiter);

    FieldValue* existing = session.current.find(name);

    if (tags.isListTag(tag)) {
        if (!existing) {
            session.current.set(name, ValueList{});
            existing = session.current.find(name);
        } else if (auto* scalar = std::get_if<std::string>(existing)) {
            *existing = ValueList{std::move(*scalar)};
        }
        if (auto* list = std::get_if<ValueList>(existing))
            appendValue(*list, std::move(value));
        return;
    }

    if (!existing) {
        session.current.set(name, std::move(value));
        return;
    }

    if (continuation) {
        auto* text = std::get_if<std::string>(&value);
        if (auto* scalar = std::get_if<std::string>(existing)) {
            if (text) {
                joinWrapped(*scalar, *text);
            } else {
                ValueList promoted{std::move(*scalar)};
                appendValue(promoted, std::move(value));
                *existing = std::move(promoted);
            }
        } else if (auto* list = std::get_if<ValueList>(existing)) {
            if (text && !list->empty())
                joinWrapped(list->back(), *text);
            else
                appendValue(*list, std::move(value));
        }
        return;
    }

    // A repeated scalar tag keeps its first value unless list enforcement is relaxed.
    if (options.enforceListTags)
        return;

    if (auto* scalar = std::get_if<std::string>(existing)) {
        ValueList promoted{std::move(*scalar)};
        appendValue(promoted, std::move(value));
        *existing = std::move(promoted);
    } else if (auto* list = std::get_if<ValueList>(existing)) {
        appendValue(*list, std::move(value));
    }
}

void Parser::addUnknownTag(ParseSession& session, const std::string& tag, std::string value) const
{
    const std::string& name = *tags.unknownFieldName();
    FieldValue* container = session.current.find(name);
    if (!container || !std::holds_alternative<UnknownTags>(*container)) {
        session.current.set(name, UnknownTags{});
        container = session.current.find(name);
    }
    std::get<UnknownTags>(*container).append(tag, std::move(value));
    session.last = ParseSession::Target::UNKNOWN;
    session.lastTag = tag;
}

void Parser::extendUnknownTag(ParseSession& session, std::string_view value) const
{
    FieldValue* container = session.current.find(*tags.unknownFieldName());
    if (!container)
        return;
    auto* unknown = std::get_if<UnknownTags>(container);
    ValueList* values = unknown ? unknown->find(session.lastTag) : nullptr;
    if (values && !values->empty())
        joinWrapped(values->back(), value);
}

Record Parser::finishRecord(ParseSession& session) const
{
    Record record = std::move(session.current);
    session.reset();
    finalizeRecord(record);
    return record;
}

// Several addresses may share one line, separated by ';'.
void Parser::finalizeRecord(Record& record) const
{
    for (const auto& field : urlFields) {
        FieldValue* value = record.find(field);
        if (!value)
            continue;

        if (auto* scalar = std::get_if<std::string>(value)) {
            if (scalar->find(';') == std::string::npos)
                continue;
            *value = splitUrls(*scalar);
        } else if (auto* list = std::get_if<ValueList>(value)) {
            ValueList urls;
            for (const auto& entry : *list) {
                ValueList pieces = splitUrls(entry);
                urls.insert(urls.end(), std::make_move_iterator(pieces.begin()), std::make_move_iterator(pieces.end()));
            }
            *list = std::move(urls);
        }
    }
}

RecordReader::RecordReader(const Parser& p, std::string text)
    : parser(p), source(stripBom(text))
{
}

std::optional<std::string_view> RecordReader::nextLine()
{
    if (cursor >= source.size())
        return std::nullopt;

    std::string_view rest = std::string_view(source).substr(cursor);
    size_t end = rest.find('\n');
    std::string_view line = rest.substr(0, end);
    cursor = end == std::string_view::npos ? source.size() : cursor + end + 1;

    if (line.ends_with('\r'))
        line.remove_suffix(1);
    return line;
}

std::optional<Record> RecordReader::next()
{
    if (done)
        return std::nullopt;

    while (auto line = nextLine()) {
        const size_t number = lineNumber++;
        if (trim(*line).empty())
            continue;

        Step step = parser.processLine(session, *line, number);
        if (auto* emitted = std::get_if<Emit>(&step))
            return std::move(emitted->record);
        if (auto* error = std::get_if<ParseError>(&step)) {
            done = true;
            throw *error;
        }
    }

    done = true;
    Step step = parser.finish(session, lineNumber);
    if (auto* emitted = std::get_if<Emit>(&step))
        return std::move(emitted->record);
    if (auto* error = std::get_if<ParseError>(&step))
        throw *error;
    return std::nullopt;
}

} // namespace ris
