#pragma once
#include "tag_map.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ris {

enum class LineKind
{
    TAG,
    CONTINUATION,
};

/**
 * @brief Dialect-specific line syntax, shared by the Parser and the Writer.
 *
 * Implementations are stateless; one instance can serve any number of parsers.
 */
class LineFormat
{
public:
    virtual ~LineFormat() = default;

    virtual Dialect dialect() const = 0;

    virtual LineKind classify(std::string_view line) const = 0;
    // Only meaningful for lines classified as TAG.
    virtual std::string_view tag(std::string_view line) const { return line.substr(0, 2); }
    virtual std::string content(std::string_view line) const = 0;

    // Noise allowed outside a record (e.g. "42." sequence numbers in RIS exports).
    virtual bool isHeader(std::string_view line) const { return false; }

    virtual std::string_view startTag() const = 0;
    // Dialects that infer record boundaries from the next start tag have no end tag.
    virtual std::optional<std::string_view> endTag() const { return "ER"; }

    // Start-tag value used when a record carries none; nullopt when there is no sensible default.
    virtual std::optional<std::string> defaultStartValue() const { return std::nullopt; }

    virtual std::string formatLine(std::string_view tag, std::string_view value) const = 0;
    // Lines after the first element of a list-valued field.
    virtual std::string formatListContinuation(std::string_view tag, std::string_view value) const
    {
        return formatLine(tag, value);
    }
    virtual std::optional<std::string> formatEndLine() const = 0;
    virtual std::optional<std::string> formatHeader(size_t count) const { return std::nullopt; }
};

class RisFormat : public LineFormat
{
public:
    Dialect dialect() const override { return Dialect::RIS; }
    LineKind classify(std::string_view line) const override;
    std::string content(std::string_view line) const override;
    bool isHeader(std::string_view line) const override;
    std::string_view startTag() const override { return "TY"; }
    std::optional<std::string> defaultStartValue() const override { return "JOUR"; }
    std::string formatLine(std::string_view tag, std::string_view value) const override;
    std::optional<std::string> formatEndLine() const override { return formatLine("ER", ""); }
    std::optional<std::string> formatHeader(size_t count) const override;
};

class WokFormat : public LineFormat
{
public:
    Dialect dialect() const override { return Dialect::WOK; }
    LineKind classify(std::string_view line) const override;
    std::string content(std::string_view line) const override;
    // Everything unindented outside a record is file preamble.
    bool isHeader(std::string_view line) const override { return true; }
    std::string_view startTag() const override { return "PT"; }
    std::optional<std::string> defaultStartValue() const override { return "J"; }
    std::string formatLine(std::string_view tag, std::string_view value) const override;
    std::string formatListContinuation(std::string_view tag, std::string_view value) const override;
    std::optional<std::string> formatEndLine() const override { return "ER"; }
};

class MedlineFormat : public LineFormat
{
public:
    Dialect dialect() const override { return Dialect::MEDLINE; }
    LineKind classify(std::string_view line) const override;
    std::string_view tag(std::string_view line) const override;
    std::string content(std::string_view line) const override;
    std::string_view startTag() const override { return "PMID"; }
    std::optional<std::string_view> endTag() const override { return std::nullopt; }
    std::string formatLine(std::string_view tag, std::string_view value) const override;
    std::optional<std::string> formatEndLine() const override { return std::nullopt; }
};

std::shared_ptr<const LineFormat> makeLineFormat(Dialect dialect);

std::string_view trim(std::string_view s);

} // namespace ris
