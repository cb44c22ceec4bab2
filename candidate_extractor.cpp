#include "candidate_extractor.h"

#include "imei_validator.h"

const std::size_t MOBILE_MIN_LENGTH = 10;
const std::size_t MOBILE_MAX_LENGTH = 15;

static bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

static std::string trimWhitespace(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

static bool hasImeiLeadingDigit(const std::string& value) {
    return !value.empty() && (value[0] == '8' || value[0] == '3');
}

static bool addUnique(std::vector<IdentifierCandidate>& candidates, const IdentifierCandidate& candidate) {
    for (const auto& existing : candidates) {
        if (existing.value == candidate.value) return false;
    }
    candidates.push_back(candidate);
    return true;
}

std::vector<std::string> findDigitRuns(const std::string& text) {
    std::vector<std::string> runs;
    size_t i = 0;
    while (i < text.length()) {
        if (!isAsciiDigit(text[i])) {
            i++;
            continue;
        }
        size_t start = i;
        while (i < text.length() && isAsciiDigit(text[i])) i++;
        runs.push_back(text.substr(start, i - start));
    }
    return runs;
}

CandidateExtractor::CandidateExtractor() {
    labeled_patterns.push_back(std::regex("IMEI1\\s*:?\\s*(\\d{15})", std::regex::icase));
    labeled_patterns.push_back(std::regex("IMEI\\s*2?\\s*:?\\s*(\\d{15})", std::regex::icase));
    labeled_patterns.push_back(std::regex("IMEI/MEID\\s*:?\\s*(\\d{15})", std::regex::icase));
}

CandidateSet CandidateExtractor::extract(const std::string& text, SourceMethod source_method) const {
    CandidateSet candidates;

    // A payload that is nothing but an IMEI-shaped number is taken as is
    std::string trimmed = trimWhitespace(text);
    if (hasImeiStructure(trimmed) && hasImeiLeadingDigit(trimmed)) {
        candidates.imei_candidates.push_back({trimmed, CandidateKind::Imei, CandidateOrigin::Unlabeled, source_method});
        return candidates;
    }

    candidates = extractFromText(text, source_method);

    if (!trimmed.empty() && (trimmed[0] == '{' || trimmed[0] == '[' || trimmed[0] == '"')) {
        nlohmann::ordered_json document = nlohmann::ordered_json::parse(trimmed, nullptr, false);
        if (!document.is_discarded()) {
            walkJson(document, source_method, candidates);
        }
    }

    return candidates;
}

CandidateSet CandidateExtractor::extractFromText(const std::string& text, SourceMethod source_method) const {
    CandidateSet candidates;

    for (const auto& pattern : labeled_patterns) {
        for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
            std::string value = (*it)[1].str();
            // A label does not make a product barcode an IMEI
            if (isDenylisted(value)) continue;
            addUnique(candidates.imei_candidates,
                      {value, CandidateKind::Imei, CandidateOrigin::Labeled, source_method});
        }
    }

    std::vector<std::string> runs = findDigitRuns(text);

    for (const auto& run : runs) {
        if (run.length() != IMEI_LENGTH) continue;
        if (isDenylisted(run) || !hasImeiLeadingDigit(run)) continue;
        addUnique(candidates.imei_candidates, {run, CandidateKind::Imei, CandidateOrigin::Unlabeled, source_method});
    }

    for (const auto& run : runs) {
        if (run.length() < MOBILE_MIN_LENGTH || run.length() > MOBILE_MAX_LENGTH) continue;
        addUnique(candidates.mobile_candidates, {run, CandidateKind::Mobile, CandidateOrigin::Unlabeled, source_method});
    }

    return candidates;
}

void CandidateExtractor::walkJson(const nlohmann::ordered_json& node, SourceMethod source_method,
                                  CandidateSet& candidates) const {
    if (node.is_string()) {
        CandidateSet leaf_candidates = extract(node.get<std::string>(), source_method);
        for (auto& candidate : leaf_candidates.imei_candidates) candidate.origin = CandidateOrigin::JsonWalk;
        for (auto& candidate : leaf_candidates.mobile_candidates) candidate.origin = CandidateOrigin::JsonWalk;
        candidates.append(leaf_candidates);
    } else if (node.is_structured()) {
        // ordered_json keeps object members in document order
        for (const auto& child : node) {
            walkJson(child, source_method, candidates);
        }
    }
}
