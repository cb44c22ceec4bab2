#ifndef IMEI_VALIDATOR_H
#define IMEI_VALIDATOR_H

#include <string>

#include "imei_scanner_types.h"

const std::size_t IMEI_LENGTH = 15;

// Exactly 15 ASCII digits.
bool hasImeiStructure(const std::string& value);

// Check digit for the first 14 digits of an IMEI. Every second digit from
// the left (positions 2, 4, ... 14) is doubled, minus 9 when above 9.
int computeLuhnCheckDigit(const std::string& body);

bool isLuhnValid(const std::string& value);

// Known product barcodes that share the IMEI length but are not device identifiers.
bool isDenylisted(const std::string& value);

// Structure, checksum and denylist together.
bool isAcceptedImei(const std::string& value);

ValidationResult validateCandidate(const IdentifierCandidate& candidate);

#endif // IMEI_VALIDATOR_H
