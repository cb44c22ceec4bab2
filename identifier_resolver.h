#ifndef IDENTIFIER_RESOLVER_H
#define IDENTIFIER_RESOLVER_H

#include <vector>

#include "imei_scanner_types.h"

// First candidate in list order that passes structure, checksum and denylist,
// or nullptr.
const IdentifierCandidate* findFirstAcceptedImei(const std::vector<IdentifierCandidate>& imei_candidates);

// Picks the single reported identifier:
//  1. first accepted IMEI                      -> SCAN_SUCCESS
//  2. otherwise the first IMEI candidate       -> SCAN_VALIDATION_FAILED (lenient fallback)
//  3. otherwise the first usable mobile number -> SCAN_SUCCESS
//  4. otherwise                                -> SCAN_NO_IDENTIFIER_FOUND
Resolution resolveIdentifier(const CandidateSet& candidates);

#endif // IDENTIFIER_RESOLVER_H
