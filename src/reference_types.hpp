#pragma once
#include "record.hpp"
#include "tag_map.hpp"
#include <string_view>
#include <vector>

namespace ris {

// RIS reference type codes ("JOUR") to readable names ("Journal").
const Mapping& typeOfReferenceMapping();

/**
 * @brief Copy records with their type_of_reference converted through typeMap.
 *
 * reverse converts names back to codes. Types missing from the map are left
 * unchanged unless strict is set, in which case a type found in neither the
 * keys nor the values throws std::out_of_range.
 */
std::vector<Record> convertReferenceTypes(const std::vector<Record>& records, bool reverse = false,
                                          bool strict = false,
                                          const Mapping& typeMap = typeOfReferenceMapping(),
                                          std::string_view field = "type_of_reference");

} // namespace ris
