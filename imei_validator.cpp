#include "imei_validator.h"

static const char* const DENYLISTED_PREFIXES[] = {"693", "690", "691", "692", "694", "695"};
static const char* const DENYLISTED_VALUES[] = {"6932204509475", "693220450947"};

static bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

bool hasImeiStructure(const std::string& value) {
    if (value.length() != IMEI_LENGTH) return false;

    for (char c : value) {
        if (!isAsciiDigit(c)) return false;
    }
    return true;
}

int computeLuhnCheckDigit(const std::string& body) {
    int sum = 0;
    for (size_t i = 0; i < body.length(); i++) {
        int digit = body[i] - '0';
        // i is zero based, so odd i is an even 1-based position
        if (i % 2 == 1) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
    }
    return (10 - (sum % 10)) % 10;
}

bool isLuhnValid(const std::string& value) {
    if (!hasImeiStructure(value)) return false;

    int check_digit = computeLuhnCheckDigit(value.substr(0, IMEI_LENGTH - 1));
    return check_digit == (value.back() - '0');
}

bool isDenylisted(const std::string& value) {
    for (const char* denylisted : DENYLISTED_VALUES) {
        if (value == denylisted) return true;
    }
    for (const char* prefix : DENYLISTED_PREFIXES) {
        if (value.compare(0, 3, prefix) == 0) return true;
    }
    return false;
}

bool isAcceptedImei(const std::string& value) {
    return hasImeiStructure(value) && isLuhnValid(value) && !isDenylisted(value);
}

ValidationResult validateCandidate(const IdentifierCandidate& candidate) {
    ValidationResult result;
    result.candidate = candidate;
    result.is_valid = false;

    if (isDenylisted(candidate.value)) {
        result.reject_reason = RejectReason::Denylisted;
    } else if (!hasImeiStructure(candidate.value)) {
        result.reject_reason = RejectReason::BadLength;
    } else if (!isLuhnValid(candidate.value)) {
        result.reject_reason = RejectReason::BadChecksum;
    } else {
        result.is_valid = true;
        result.reject_reason = RejectReason::None;
    }
    return result;
}
