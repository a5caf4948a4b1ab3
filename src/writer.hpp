#pragma once
#include "errors.hpp"
#include "line_format.hpp"
#include "record.hpp"
#include "tag_map.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ris {

// A field that could not be written. Reported, never thrown.
struct ExportWarning {
    std::string label;
    std::string message;
};

using WarningHandler = std::function<void(const ExportWarning&)>;

// Prints "Warning: <message>" to std::cerr.
void logWarning(const ExportWarning& warning);

struct WriterOptions {
    Dialect dialect = Dialect::RIS;
    TagConfig tags;
    bool skipUnknownTags = false;
    bool enforceListTags = true;
    // Start-tag value for records without one. Unset uses the dialect's default, empty disables it.
    std::optional<std::string> defaultReferenceType;
    std::string newline = "\n";
    bool writeHeaders = true;
    bool separateRecords = true;
    WarningHandler onWarning = logWarning;
};

class Writer
{
    WriterOptions options;
    TagMap tags;
    Mapping reverse; // field name -> tag
    std::shared_ptr<const LineFormat> format;
    std::optional<std::string> defaultStart;

    std::string startValue(const Record& record) const;
    void warn(const std::string& label, const std::string& message) const;
    void formatField(std::vector<std::string>& lines, const std::string& label, const FieldValue& value) const;

public:
    // Throws ConfigurationError when the mapping cannot be inverted.
    explicit Writer(WriterOptions opts = {});

    // Lines of one record, without newlines. count is the 1-based position used for the header.
    std::vector<std::string> formatRecord(const Record& record, size_t count) const;
    std::vector<std::string> formatLines(const std::vector<Record>& records) const;

    std::string write(const std::vector<Record>& records) const;
    void write(const std::vector<Record>& records, std::ostream& out) const;

    const TagMap& tagMap() const { return tags; }
    const LineFormat& lineFormat() const { return *format; }
};

} // namespace ris
