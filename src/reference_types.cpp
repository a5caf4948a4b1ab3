#include "reference_types.hpp"
#include <stdexcept>

namespace ris {

const Mapping& typeOfReferenceMapping()
{
    static const Mapping mapping = {
        {"ABST", "Abstract"},
        {"ADVS", "Audiovisual material"},
        {"AGGR", "Aggregated Database"},
        {"ANCIENT", "Ancient Text"},
        {"ART", "Art Work"},
        {"BILL", "Bill"},
        {"BLOG", "Blog"},
        {"BOOK", "Whole book"},
        {"CASE", "Case"},
        {"CHAP", "Book chapter"},
        {"CHART", "Chart"},
        {"CLSWK", "Classical Work"},
        {"COMP", "Computer program"},
        {"CONF", "Conference proceeding"},
        {"CPAPER", "Conference paper"},
        {"CTLG", "Catalog"},
        {"DATA", "Data file"},
        {"DBASE", "Online Database"},
        {"DICT", "Dictionary"},
        {"EBOOK", "Electronic Book"},
        {"ECHAP", "Electronic Book Section"},
        {"EDBOOK", "Edited Book"},
        {"EJOUR", "Electronic Article"},
        {"ELEC", "Web Page"},
        {"ENCYC", "Encyclopedia"},
        {"EQUA", "Equation"},
        {"FIGURE", "Figure"},
        {"GEN", "Generic"},
        {"GOVDOC", "Government Document"},
        {"GRANT", "Grant"},
        {"HEAR", "Hearing"},
        {"ICOMM", "Internet Communication"},
        {"INPR", "In Press"},
        {"JFULL", "Journal (full)"},
        {"JOUR", "Journal"},
        {"LEGAL", "Legal Rule or Regulation"},
        {"MANSCPT", "Manuscript"},
        {"MAP", "Map"},
        {"MGZN", "Magazine article"},
        {"MPCT", "Motion picture"},
        {"MULTI", "Online Multimedia"},
        {"MUSIC", "Music score"},
        {"NEWS", "Newspaper"},
        {"PAMP", "Pamphlet"},
        {"PAT", "Patent"},
        {"PCOMM", "Personal communication"},
        {"RPRT", "Report"},
        {"SER", "Serial publication"},
        {"SLIDE", "Slide"},
        {"SOUND", "Sound recording"},
        {"STAND", "Standard"},
        {"STAT", "Statute"},
        {"THES", "Thesis/Dissertation"},
        {"UNBILL", "Unenacted Bill"},
        {"UNPB", "Unpublished work"},
        {"VIDEO", "Video recording"},
    };
    return mapping;
}

std::vector<Record> convertReferenceTypes(const std::vector<Record>& records, bool reverse, bool strict,
                                          const Mapping& typeMap, std::string_view field)
{
    const Mapping lookup = reverse ? invertMapping(typeMap) : typeMap;
    const Mapping targets = invertMapping(lookup);

    std::vector<Record> converted = records;
    for (auto& record : converted) {
        const std::string* type = record.scalar(field);
        if (!type)
            continue;

        auto found = lookup.find(*type);
        if (found != lookup.end()) {
            record.set(field, found->second);
            continue;
        }
        // a type already in the target vocabulary is fine
        if (strict && targets.count(*type) == 0)
            throw std::out_of_range("Type \"" + *type + "\" not found.");
    }
    return converted;
}

} // namespace ris
