#include "writer.hpp"
#include <iostream>
#include <iterator>
#include <sstream>

namespace ris {

void logWarning(const ExportWarning& warning)
{
    std::cerr << "Warning: " << warning.message << std::endl;
}

Writer::Writer(WriterOptions opts)
    : options(std::move(opts)),
      tags(TagMap::resolve(options.dialect, options.tags)),
      reverse(tags.inverted()),
      format(makeLineFormat(options.dialect))
{
    defaultStart = options.defaultReferenceType ? options.defaultReferenceType : format->defaultStartValue();
    if (defaultStart && defaultStart->empty())
        defaultStart.reset();
}

void Writer::warn(const std::string& label, const std::string& message) const
{
    if (options.onWarning)
        options.onWarning(ExportWarning{label, message});
}

std::string Writer::startValue(const Record& record) const
{
    const std::string* name = tags.fieldName(format->startTag());
    if (name) {
        if (const auto* value = record.scalar(*name))
            return *value;
        if (const auto* values = record.list(*name); values && !values->empty())
            return values->front();
    }
    if (defaultStart)
        return *defaultStart;
    throw ConfigurationError("Record has no " + std::string(format->startTag()) +
                             " value and no default reference type is configured");
}

void Writer::formatField(std::vector<std::string>& lines, const std::string& label, const FieldValue& value) const
{
    auto found = reverse.find(label);
    if (found == reverse.end()) {
        warn(label, "label `" + label + "` not exported");
        return;
    }
    const std::string& tag = found->second;

    const auto endTag = format->endTag();
    if (tag == format->startTag() || (endTag && tag == *endTag) || tags.isIgnored(tag))
        return;

    if (const auto* unknown = std::get_if<UnknownTags>(&value)) {
        if (options.skipUnknownTags)
            return;
        for (const auto& [unknownTag, values] : *unknown) {
            for (const auto& v : values) {
                lines.push_back(format->formatLine(unknownTag, v));
            }
        }
        return;
    }

    if (const auto* text = std::get_if<std::string>(&value)) {
        lines.push_back(format->formatLine(tag, *text));
        return;
    }

    const auto& values = std::get<ValueList>(value);
    if (const auto* delimiter = tags.delimiter(tag)) {
        std::string joined;
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) joined += *delimiter;
            joined += values[i];
        }
        lines.push_back(format->formatLine(tag, joined));
        return;
    }

    const bool listTag = tags.isListTag(tag);
    if (options.enforceListTags && !listTag && values.size() > 1)
        warn(label, "label `" + label + "` has several values but `" + tag +
                        "` is not a list tag; only the first is read back");

    for (size_t i = 0; i < values.size(); ++i) {
        lines.push_back(i > 0 && listTag ? format->formatListContinuation(tag, values[i])
                                         : format->formatLine(tag, values[i]));
    }
}

std::vector<std::string> Writer::formatRecord(const Record& record, size_t count) const
{
    std::vector<std::string> lines;

    if (options.writeHeaders) {
        if (auto header = format->formatHeader(count))
            lines.push_back(std::move(*header));
    }
    lines.push_back(format->formatLine(format->startTag(), startValue(record)));

    for (const auto& [label, value] : record) {
        formatField(lines, label, value);
    }

    if (auto end = format->formatEndLine())
        lines.push_back(std::move(*end));
    return lines;
}

std::vector<std::string> Writer::formatLines(const std::vector<Record>& records) const
{
    std::vector<std::string> lines;
    for (size_t i = 0; i < records.size(); ++i) {
        if (i > 0 && options.separateRecords)
            lines.emplace_back();
        auto recordLines = formatRecord(records[i], i + 1);
        lines.insert(lines.end(), std::make_move_iterator(recordLines.begin()),
                     std::make_move_iterator(recordLines.end()));
    }
    return lines;
}

void Writer::write(const std::vector<Record>& records, std::ostream& out) const
{
    for (const auto& line : formatLines(records)) {
        out << line << options.newline;
    }
}

std::string Writer::write(const std::vector<Record>& records) const
{
    std::ostringstream oss;
    write(records, oss);
    return oss.str();
}

} // namespace ris
