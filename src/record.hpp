#pragma once
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ris {

using ValueList = std::vector<std::string>;

/**
 * @brief Tags that had no field name in the active mapping, with their raw values.
 *
 * Keeps the order in which the tags were first seen. Compared as a mapping,
 * so two containers holding the same tags in a different order are equal.
 */
class UnknownTags
{
public:
    using Entry = std::pair<std::string, ValueList>;

    UnknownTags() = default;
    UnknownTags(std::initializer_list<Entry> init);

    void append(std::string_view tag, std::string value);
    ValueList* find(std::string_view tag);
    const ValueList* find(std::string_view tag) const;

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
    std::vector<Entry>::const_iterator begin() const { return entries.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries.end(); }

    bool operator==(const UnknownTags& other) const;
    bool operator!=(const UnknownTags& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries;
};

// A field holds a scalar, a list, or (under the reserved name) the unknown-tag container.
using FieldValue = std::variant<std::string, ValueList, UnknownTags>;

class Record
{
public:
    using Field = std::pair<std::string, FieldValue>;
    using const_iterator = std::vector<Field>::const_iterator;

    Record() = default;
    Record(std::initializer_list<Field> init);

    bool contains(std::string_view name) const { return find(name) != nullptr; }
    FieldValue* find(std::string_view name);
    const FieldValue* find(std::string_view name) const;

    // Throws std::out_of_range when the field is absent.
    const FieldValue& at(std::string_view name) const;

    // Typed lookups; nullptr when absent or holding another alternative.
    const std::string* scalar(std::string_view name) const;
    const ValueList* list(std::string_view name) const;
    const UnknownTags* unknownTags(std::string_view name) const;

    // Replaces an existing value in place, otherwise appends the field at the end.
    void set(std::string_view name, FieldValue value);
    bool erase(std::string_view name);

    size_t size() const { return fields.size(); }
    bool empty() const { return fields.empty(); }
    const_iterator begin() const { return fields.begin(); }
    const_iterator end() const { return fields.end(); }

    std::string to_string() const;

    // Mapping equality: insertion order is not significant.
    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }

private:
    std::vector<Field> fields;
};

std::ostream& operator<<(std::ostream& os, const Record& record);

} // namespace ris
