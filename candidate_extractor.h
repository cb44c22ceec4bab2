#ifndef CANDIDATE_EXTRACTOR_H
#define CANDIDATE_EXTRACTOR_H

#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "imei_scanner_types.h"

// Pulls identifier-shaped substrings out of decoded text.
//
// Labeled IMEI patterns are collected first, in priority order (IMEI1 before
// IMEI2 and IMEI/MEID), then unlabeled 15 digit runs starting with 8 or 3.
// Every 10 to 15 digit run is also collected as a mobile candidate. Text that
// parses as JSON is additionally walked leaf by leaf.
class CandidateExtractor {
public:
    CandidateExtractor();

    CandidateSet extract(const std::string& text, SourceMethod source_method) const;

private:
    CandidateSet extractFromText(const std::string& text, SourceMethod source_method) const;
    void walkJson(const nlohmann::ordered_json& node, SourceMethod source_method, CandidateSet& candidates) const;

    std::vector<std::regex> labeled_patterns;
};

// Maximal runs of ASCII digits, in order of appearance.
std::vector<std::string> findDigitRuns(const std::string& text);

#endif // CANDIDATE_EXTRACTOR_H
