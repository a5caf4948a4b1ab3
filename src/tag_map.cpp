#include "tag_map.hpp"

namespace ris {

namespace {

const Mapping RIS_TAG_KEY_MAPPING = {
    {"TY", "type_of_reference"},
    {"A1", "first_authors"},
    {"A2", "secondary_authors"},
    {"A3", "tertiary_authors"},
    {"A4", "subsidiary_authors"},
    {"AB", "abstract"},
    {"AD", "author_address"},
    {"AN", "accession_number"},
    {"AU", "authors"},
    {"C1", "custom1"},
    {"C2", "custom2"},
    {"C3", "custom3"},
    {"C4", "custom4"},
    {"C5", "custom5"},
    {"C6", "custom6"},
    {"C7", "custom7"},
    {"C8", "custom8"},
    {"CA", "caption"},
    {"CN", "call_number"},
    {"CY", "place_published"},
    {"DA", "date"},
    {"DB", "name_of_database"},
    {"DO", "doi"},
    {"DP", "database_provider"},
    {"EP", "end_page"},
    {"ER", "end_of_reference"},
    {"ET", "edition"},
    {"ID", "id"},
    {"IS", "number"},
    {"J2", "alternate_title1"},
    {"JA", "alternate_title2"},
    {"JF", "alternate_title3"},
    {"JO", "journal_name"},
    {"KW", "keywords"},
    {"L1", "file_attachments1"},
    {"L2", "file_attachments2"},
    {"L4", "figure"},
    {"LA", "language"},
    {"LB", "label"},
    {"M1", "note"},
    {"M3", "type_of_work"},
    {"N1", "notes"},
    {"N2", "notes_abstract"},
    {"NV", "number_of_volumes"},
    {"OP", "original_publication"},
    {"PB", "publisher"},
    {"PY", "year"},
    {"RI", "reviewed_item"},
    {"RN", "research_notes"},
    {"RP", "reprint_edition"},
    {"SE", "section"},
    {"SN", "issn"},
    {"SP", "start_page"},
    {"ST", "short_title"},
    {"T1", "primary_title"},
    {"T2", "secondary_title"},
    {"T3", "tertiary_title"},
    {"TA", "translated_author"},
    {"TI", "title"},
    {"TT", "translated_title"},
    {"UR", "urls"},
    {"VL", "volume"},
    {"Y1", "publication_year"},
    {"Y2", "access_date"},
    {"UK", "unknown_tag"},
};

const TagSet RIS_LIST_TYPE_TAGS = {
    "A1", "A2", "A3", "A4", "AU", "KW", "L1", "L2", "L4", "N1", "TA", "UR",
};

// Web of Science field tags.
const Mapping WOK_TAG_KEY_MAPPING = {
    {"FN", "file_name"},
    {"VR", "version_number"},
    {"PT", "publication_type"},
    {"AU", "authors"},
    {"AF", "author_full_names"},
    {"BA", "book_authors"},
    {"BF", "book_authors_full_name"},
    {"CA", "group_authors"},
    {"GP", "book_group_authors"},
    {"BE", "editors"},
    {"TI", "document_title"},
    {"SO", "publication_name"},
    {"SE", "book_series_title"},
    {"BS", "book_series_subtitle"},
    {"LA", "language"},
    {"DT", "document_type"},
    {"CT", "conference_title"},
    {"CY", "conference_date"},
    {"HO", "conference_host"},
    {"CL", "conference_location"},
    {"SP", "conference_sponsors"},
    {"FO", "funding_organization"},
    {"DE", "author_keywords"},
    {"ID", "keywords_plus"},
    {"AB", "abstract"},
    {"C1", "author_address"},
    {"RP", "reprint_address"},
    {"EM", "email_address"},
    {"RI", "researcher_id_numbers"},
    {"OI", "orcid_identifiers"},
    {"FU", "funding_agency_and_grant_number"},
    {"FX", "funding_text"},
    {"CR", "cited_references"},
    {"NR", "cited_reference_count"},
    {"TC", "wos_times_cited_count"},
    {"Z9", "total_times_cited_count"},
    {"U1", "usage_count_180_days"},
    {"U2", "usage_count_since_2013"},
    {"PU", "publisher"},
    {"PI", "publisher_city"},
    {"PA", "publisher_address"},
    {"SN", "issn"},
    {"EI", "eissn"},
    {"BN", "isbn"},
    {"J9", "source_abbreviation_29"},
    {"JI", "iso_source_abbreviation"},
    {"PD", "publication_date"},
    {"PY", "year_published"},
    {"VL", "volume"},
    {"IS", "issue"},
    {"SI", "special_issue"},
    {"PN", "part_number"},
    {"SU", "supplement"},
    {"MA", "meeting_abstract"},
    {"BP", "beginning_page"},
    {"EP", "ending_page"},
    {"AR", "article_number"},
    {"DI", "doi"},
    {"D2", "book_doi"},
    {"EA", "early_access_date"},
    {"EY", "early_access_year"},
    {"PG", "page_count"},
    {"P2", "chapter_count"},
    {"WC", "wos_categories"},
    {"SC", "research_areas"},
    {"GA", "document_delivery_number"},
    {"PM", "pubmed_id"},
    {"UT", "accession_number"},
    {"OA", "open_access_indicator"},
    {"HP", "highly_cited"},
    {"HC", "hot_paper"},
    {"DA", "date_generated"},
    {"ER", "end_of_record"},
    {"EF", "end_of_file"},
    {"UK", "unknown_tag"},
};

const TagSet WOK_LIST_TYPE_TAGS = {
    "AU", "AF", "BA", "BF", "CA", "GP", "BE", "DE", "ID",
    "C1", "EM", "RI", "OI", "FU", "CR", "WC", "SC",
};

const TagSet WOK_IGNORE_TAGS = {"FN", "VR", "EF"};

// PubMed / MEDLINE display format.
const Mapping MEDLINE_TAG_KEY_MAPPING = {
    {"PMID", "pubmed_id"},
    {"OWN", "owner"},
    {"STAT", "status"},
    {"DCOM", "date_completed"},
    {"LR", "date_last_revised"},
    {"IS", "issn"},
    {"VI", "volume"},
    {"IP", "issue"},
    {"DP", "publication_date"},
    {"TI", "title"},
    {"BTI", "book_title"},
    {"PG", "pagination"},
    {"LID", "location_identifier"},
    {"AB", "abstract"},
    {"CI", "copyright_information"},
    {"FAU", "full_author_names"},
    {"AU", "authors"},
    {"AUID", "author_identifiers"},
    {"AD", "affiliations"},
    {"CN", "corporate_authors"},
    {"FED", "full_editor_names"},
    {"ED", "editors"},
    {"LA", "language"},
    {"GR", "grant_numbers"},
    {"PT", "publication_types"},
    {"DEP", "electronic_publication_date"},
    {"PL", "place_of_publication"},
    {"TA", "journal_title_abbreviation"},
    {"JT", "journal_title"},
    {"JID", "nlm_unique_id"},
    {"RN", "registry_numbers"},
    {"SB", "subset"},
    {"MH", "mesh_terms"},
    {"OTO", "other_term_owner"},
    {"OT", "other_terms"},
    {"OID", "other_ids"},
    {"SI", "secondary_source_ids"},
    {"GN", "general_notes"},
    {"COIS", "conflict_of_interest"},
    {"TT", "transliterated_title"},
    {"EDAT", "entrez_date"},
    {"MHDA", "mesh_date"},
    {"CRDT", "create_date"},
    {"PHST", "publication_history"},
    {"AID", "article_identifiers"},
    {"PST", "publication_status"},
    {"SO", "source"},
    {"PMC", "pmc_id"},
    {"MID", "manuscript_id"},
    {"UK", "unknown_tag"},
};

const TagSet MEDLINE_LIST_TYPE_TAGS = {
    "IS", "LID", "FAU", "AU", "AUID", "AD", "CN", "FED", "ED", "LA", "GR", "PT",
    "RN", "SB", "MH", "OT", "OID", "SI", "GN", "PHST", "AID",
};

const TagSet NO_TAGS = {};

} // namespace

const Mapping& defaultMapping(Dialect dialect)
{
    switch (dialect)
    {
    case Dialect::WOK:
        return WOK_TAG_KEY_MAPPING;
    case Dialect::MEDLINE:
        return MEDLINE_TAG_KEY_MAPPING;
    case Dialect::RIS:
    default:
        return RIS_TAG_KEY_MAPPING;
    }
}

const TagSet& defaultListTags(Dialect dialect)
{
    switch (dialect)
    {
    case Dialect::WOK:
        return WOK_LIST_TYPE_TAGS;
    case Dialect::MEDLINE:
        return MEDLINE_LIST_TYPE_TAGS;
    case Dialect::RIS:
    default:
        return RIS_LIST_TYPE_TAGS;
    }
}

const TagSet& defaultIgnoreTags(Dialect dialect)
{
    return dialect == Dialect::WOK ? WOK_IGNORE_TAGS : NO_TAGS;
}

Mapping invertMapping(const Mapping& mapping)
{
    Mapping remap;
    for (const auto& [key, value] : mapping) {
        remap.emplace(value, key);
    }
    if (remap.size() != mapping.size())
        throw ConfigurationError("Mapping cannot be inverted; some values were not unique");
    return remap;
}

std::string_view dialectName(Dialect dialect)
{
    switch (dialect)
    {
    case Dialect::WOK:
        return "wok";
    case Dialect::MEDLINE:
        return "medline";
    case Dialect::RIS:
    default:
        return "ris";
    }
}

Dialect dialectFromName(std::string_view name)
{
    if (name == "ris")
        return Dialect::RIS;
    if (name == "wok" || name == "wos")
        return Dialect::WOK;
    if (name == "medline" || name == "pubmed")
        return Dialect::MEDLINE;
    throw ConfigurationError("Unknown dialect: " + std::string(name));
}

TagMap TagMap::defaults(Dialect dialect)
{
    return TagMap{defaultMapping(dialect), defaultListTags(dialect), DelimiterMap{}, defaultIgnoreTags(dialect)};
}

TagMap TagMap::resolve(Dialect dialect, const TagConfig& config)
{
    TagMap tags = defaults(dialect);
    if (config.mapping)
        tags.mapping = *config.mapping;
    if (config.listTags)
        tags.listTags = *config.listTags;
    if (config.delimiters)
        tags.delimiters = *config.delimiters;
    if (config.ignore)
        tags.ignore = *config.ignore;
    return tags;
}

const std::string* TagMap::fieldName(std::string_view tag) const
{
    auto it = mapping.find(tag);
    return it == mapping.end() ? nullptr : &it->second;
}

const std::string* TagMap::delimiter(std::string_view tag) const
{
    auto it = delimiters.find(tag);
    if (it == delimiters.end() || it->second.empty())
        return nullptr;
    return &it->second;
}

} // namespace ris
