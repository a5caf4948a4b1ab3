#pragma once
#include "errors.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace ris {

enum class Dialect
{
    RIS,     // "TY  - JOUR" ... "ER  - "
    WOK,     // Web of Science export: "PT J" ... "ER"
    MEDLINE, // PubMed: "PMID- 123", no end tag
};

using Mapping = std::map<std::string, std::string, std::less<>>;
using TagSet = std::set<std::string, std::less<>>;
using DelimiterMap = std::map<std::string, std::string, std::less<>>;

// Tag code holding the unknown-tag container's field name.
inline constexpr std::string_view UNKNOWN_TAG = "UK";

// Each set override replaces the dialect default entirely; nothing is merged.
struct TagConfig {
    std::optional<Mapping> mapping;
    std::optional<TagSet> listTags;
    std::optional<DelimiterMap> delimiters;
    std::optional<TagSet> ignore;
};

const Mapping& defaultMapping(Dialect dialect);
const TagSet& defaultListTags(Dialect dialect);
const TagSet& defaultIgnoreTags(Dialect dialect);

/**
 * @brief Swap keys and values.
 * @throws ConfigurationError if two keys share a value.
 */
Mapping invertMapping(const Mapping& mapping);

std::string_view dialectName(Dialect dialect);
// Accepts "ris", "wok" and "medline" (or "pubmed"); throws ConfigurationError otherwise.
Dialect dialectFromName(std::string_view name);

/**
 * @brief Resolved tag configuration used by one Parser or Writer.
 *
 * Fixed at construction and only read afterwards.
 */
struct TagMap {
    Mapping mapping;
    TagSet listTags;
    DelimiterMap delimiters;
    TagSet ignore;

    static TagMap defaults(Dialect dialect);
    static TagMap resolve(Dialect dialect, const TagConfig& config);

    const std::string* fieldName(std::string_view tag) const;
    const std::string* delimiter(std::string_view tag) const;
    bool isListTag(std::string_view tag) const { return listTags.find(tag) != listTags.end(); }
    bool isIgnored(std::string_view tag) const { return ignore.find(tag) != ignore.end(); }

    // Field name reserved for the unknown-tag container, nullptr when the mapping has no "UK" entry.
    const std::string* unknownFieldName() const { return fieldName(UNKNOWN_TAG); }

    Mapping inverted() const { return invertMapping(mapping); }
};

} // namespace ris
