#include "identifier_resolver.h"

#include "imei_validator.h"

const IdentifierCandidate* findFirstAcceptedImei(const std::vector<IdentifierCandidate>& imei_candidates) {
    for (const auto& candidate : imei_candidates) {
        if (validateCandidate(candidate).is_valid) {
            return &candidate;
        }
    }
    return nullptr;
}

Resolution resolveIdentifier(const CandidateSet& candidates) {
    Resolution resolution;

    const IdentifierCandidate* accepted = findFirstAcceptedImei(candidates.imei_candidates);
    if (accepted) {
        resolution.status = SCAN_SUCCESS;
        resolution.candidate = *accepted;
        return resolution;
    }

    // TODO: confirm with product owners whether this fallback should stay once
    // operators rely on it; callers can tell it apart by SCAN_VALIDATION_FAILED.
    for (const auto& imei : candidates.imei_candidates) {
        if (isDenylisted(imei.value)) continue;
        resolution.status = SCAN_VALIDATION_FAILED;
        resolution.candidate = imei;
        return resolution;
    }

    for (const auto& mobile : candidates.mobile_candidates) {
        // Product barcodes share the mobile length range
        if (isDenylisted(mobile.value)) continue;

        resolution.status = SCAN_SUCCESS;
        resolution.candidate = mobile;
        return resolution;
    }

    resolution.status = SCAN_NO_IDENTIFIER_FOUND;
    return resolution;
}
