#include "record.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace ris {

UnknownTags::UnknownTags(std::initializer_list<Entry> init)
{
    for (const auto& [tag, values] : init) {
        for (const auto& value : values) {
            append(tag, value);
        }
        if (values.empty() && !find(tag)) {
            entries.emplace_back(tag, ValueList{});
        }
    }
}

void UnknownTags::append(std::string_view tag, std::string value)
{
    if (auto* values = find(tag)) {
        values->push_back(std::move(value));
        return;
    }
    entries.emplace_back(std::string(tag), ValueList{std::move(value)});
}

ValueList* UnknownTags::find(std::string_view tag)
{
    auto it = std::find_if(entries.begin(), entries.end(),
                           [tag](const Entry& e) { return e.first == tag; });
    return it == entries.end() ? nullptr : &it->second;
}

const ValueList* UnknownTags::find(std::string_view tag) const
{
    return const_cast<UnknownTags*>(this)->find(tag);
}

bool UnknownTags::operator==(const UnknownTags& other) const
{
    if (entries.size() != other.entries.size())
        return false;
    return std::all_of(entries.begin(), entries.end(), [&other](const Entry& e) {
        const auto* values = other.find(e.first);
        return values && *values == e.second;
    });
}

Record::Record(std::initializer_list<Field> init)
{
    for (const auto& [name, value] : init) {
        set(name, value);
    }
}

FieldValue* Record::find(std::string_view name)
{
    auto it = std::find_if(fields.begin(), fields.end(),
                           [name](const Field& f) { return f.first == name; });
    return it == fields.end() ? nullptr : &it->second;
}

const FieldValue* Record::find(std::string_view name) const
{
    return const_cast<Record*>(this)->find(name);
}

const FieldValue& Record::at(std::string_view name) const
{
    if (const auto* value = find(name))
        return *value;
    throw std::out_of_range("No field named " + std::string(name));
}

const std::string* Record::scalar(std::string_view name) const
{
    const auto* value = find(name);
    return value ? std::get_if<std::string>(value) : nullptr;
}

const ValueList* Record::list(std::string_view name) const
{
    const auto* value = find(name);
    return value ? std::get_if<ValueList>(value) : nullptr;
}

const UnknownTags* Record::unknownTags(std::string_view name) const
{
    const auto* value = find(name);
    return value ? std::get_if<UnknownTags>(value) : nullptr;
}

void Record::set(std::string_view name, FieldValue value)
{
    if (auto* existing = find(name)) {
        *existing = std::move(value);
        return;
    }
    fields.emplace_back(std::string(name), std::move(value));
}

bool Record::erase(std::string_view name)
{
    auto it = std::find_if(fields.begin(), fields.end(),
                           [name](const Field& f) { return f.first == name; });
    if (it == fields.end())
        return false;
    fields.erase(it);
    return true;
}

bool Record::operator==(const Record& other) const
{
    if (fields.size() != other.fields.size())
        return false;
    return std::all_of(fields.begin(), fields.end(), [&other](const Field& f) {
        const auto* value = other.find(f.first);
        return value && *value == f.second;
    });
}

namespace {

void quote(std::ostream& os, const std::string& s)
{
    os << '"' << s << '"';
}

void quoteList(std::ostream& os, const ValueList& values)
{
    os << '[';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) os << ", ";
        quote(os, values[i]);
    }
    os << ']';
}

} // namespace

std::string Record::to_string() const
{
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [name, value] : fields) {
        if (!first) oss << ", ";
        first = false;
        oss << name << ": ";
        if (const auto* s = std::get_if<std::string>(&value)) {
            quote(oss, *s);
        } else if (const auto* l = std::get_if<ValueList>(&value)) {
            quoteList(oss, *l);
        } else {
            const auto& unknown = std::get<UnknownTags>(value);
            oss << '{';
            bool firstTag = true;
            for (const auto& [tag, values] : unknown) {
                if (!firstTag) oss << ", ";
                firstTag = false;
                oss << tag << ": ";
                quoteList(oss, values);
            }
            oss << '}';
        }
    }
    oss << '}';
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Record& record)
{
    return os << record.to_string();
}

} // namespace ris
