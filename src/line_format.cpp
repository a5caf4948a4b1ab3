#include "line_format.hpp"
#include <cctype>

namespace ris {

namespace {

bool isUpper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool isUpperOrDigit(char c) { return isUpper(c) || std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool onlySpaces(std::string_view s)
{
    for (char c : s) {
        if (!isSpace(c)) return false;
    }
    return true;
}

std::string contentFrom(std::string_view line, size_t column)
{
    if (line.size() <= column)
        return "";
    return std::string(trim(line.substr(column)));
}

} // namespace

std::string_view trim(std::string_view s)
{
    size_t start = 0;
    while (start < s.size() && isSpace(s[start])) ++start;
    size_t end = s.size();
    while (end > start && isSpace(s[end - 1])) --end;
    return s.substr(start, end - start);
}

// "AU  - Shannon" or a bare "ER  -"
LineKind RisFormat::classify(std::string_view line) const
{
    if (line.size() >= 6 && isUpper(line[0]) && isUpperOrDigit(line[1]) && line.substr(2, 4) == "  - ")
        return LineKind::TAG;
    if (line.starts_with("ER  -") && onlySpaces(line.substr(5)))
        return LineKind::TAG;
    return LineKind::CONTINUATION;
}

std::string RisFormat::content(std::string_view line) const
{
    return contentFrom(line, 6);
}

// Sequence-number lines such as "1." between records.
bool RisFormat::isHeader(std::string_view line) const
{
    return line.size() >= 2 && std::isdigit(static_cast<unsigned char>(line[0]));
}

std::string RisFormat::formatLine(std::string_view tag, std::string_view value) const
{
    std::string line(tag);
    line += "  - ";
    line += value;
    return line;
}

std::optional<std::string> RisFormat::formatHeader(size_t count) const
{
    return std::to_string(count) + ".";
}

LineKind WokFormat::classify(std::string_view line) const
{
    if (line.starts_with("ER") || line.starts_with("EF"))
        return LineKind::TAG;
    if (line.size() >= 3 && isUpper(line[0]) && isUpperOrDigit(line[1]) && line[2] == ' ')
        return LineKind::TAG;
    return LineKind::CONTINUATION;
}

std::string WokFormat::content(std::string_view line) const
{
    return contentFrom(line, 2);
}

std::string WokFormat::formatLine(std::string_view tag, std::string_view value) const
{
    std::string line(tag);
    line += ' ';
    line += value;
    return line;
}

std::string WokFormat::formatListContinuation(std::string_view tag, std::string_view value) const
{
    // an indented empty value would read back as a blank line
    if (value.empty())
        return formatLine(tag, value);
    return "   " + std::string(value);
}

// Four-column tag field padded with spaces, then "- ": "PMID- 1", "AU  - Doe J".
LineKind MedlineFormat::classify(std::string_view line) const
{
    if (line.size() < 5 || !isUpper(line[0]) || line[4] != '-')
        return LineKind::CONTINUATION;
    if (line.size() > 5 && line[5] != ' ')
        return LineKind::CONTINUATION;
    bool padding = false;
    for (size_t i = 1; i < 4; ++i) {
        if (line[i] == ' ') {
            padding = true;
        } else if (padding || !isUpperOrDigit(line[i])) {
            return LineKind::CONTINUATION;
        }
    }
    return LineKind::TAG;
}

std::string_view MedlineFormat::tag(std::string_view line) const
{
    return trim(line.substr(0, 4));
}

std::string MedlineFormat::content(std::string_view line) const
{
    return contentFrom(line, 6);
}

std::string MedlineFormat::formatLine(std::string_view tag, std::string_view value) const
{
    std::string line(tag);
    if (line.size() < 4)
        line.append(4 - line.size(), ' ');
    line += "- ";
    line += value;
    return line;
}

std::shared_ptr<const LineFormat> makeLineFormat(Dialect dialect)
{
    switch (dialect)
    {
    case Dialect::WOK:
        return std::make_shared<WokFormat>();
    case Dialect::MEDLINE:
        return std::make_shared<MedlineFormat>();
    case Dialect::RIS:
    default:
        return std::make_shared<RisFormat>();
    }
}

} // namespace ris
