#ifndef IMEI_SCANNER_TYPES_H
#define IMEI_SCANNER_TYPES_H

#include <string>
#include <vector>

// Outcome and error taxonomy shared by the pipeline and the scan session
enum ScanStatus {
    SCAN_SUCCESS = 0,
    SCAN_PERMISSION_DENIED = 1,
    SCAN_DEVICE_NOT_FOUND = 2,
    SCAN_DEVICE_BUSY = 3,
    SCAN_UNSUPPORTED_CONSTRAINTS = 4,
    SCAN_NO_IDENTIFIER_FOUND = 5,
    SCAN_VALIDATION_FAILED = 6,
    SCAN_TRANSIENT_DECODER_ERROR = 7,
    SCAN_INVALID_IMAGE = 8
};

enum class SourceMethod {
    Barcode1D,
    Barcode2D,
    RawMatrix,
    OCR
};

struct DecodedPayload {
    std::string text;
    SourceMethod source_method;
    std::string format_name;  // symbology or engine name, for logging only
};

enum class CandidateKind {
    Imei,
    Mobile
};

enum class CandidateOrigin {
    Labeled,
    Unlabeled,
    JsonWalk
};

struct IdentifierCandidate {
    std::string value;
    CandidateKind kind = CandidateKind::Imei;
    CandidateOrigin origin = CandidateOrigin::Unlabeled;
    SourceMethod source_method = SourceMethod::OCR;
};

enum class RejectReason {
    None,
    BadLength,
    BadChecksum,
    Denylisted
};

struct ValidationResult {
    IdentifierCandidate candidate;
    bool is_valid = false;
    RejectReason reject_reason = RejectReason::None;
};

// Both lists keep first-seen order and hold each value at most once.
struct CandidateSet {
    std::vector<IdentifierCandidate> imei_candidates;
    std::vector<IdentifierCandidate> mobile_candidates;

    void append(const CandidateSet& other);
    bool empty() const;
};

struct Resolution {
    ScanStatus status = SCAN_NO_IDENTIFIER_FOUND;
    IdentifierCandidate candidate;

    bool hasIdentifier() const {
        return status == SCAN_SUCCESS || status == SCAN_VALIDATION_FAILED;
    }
};

enum class PipelineStage {
    None,
    DirectBarcode,
    DirectOcr,
    DirectMatrix,
    EnhancedBarcode,
    EnhancedMatrix,
    ResizedBarcode,
    ResizedMatrix,
    ComprehensiveOcr
};

struct DetectionResult {
    Resolution resolution;
    PipelineStage stage = PipelineStage::None;
    CandidateSet candidates;
    int attempts = 0;
};

struct ScanOutcome {
    ScanStatus status = SCAN_NO_IDENTIFIER_FOUND;
    std::string identifier;
    CandidateKind kind = CandidateKind::Imei;
    CandidateOrigin origin = CandidateOrigin::Unlabeled;
    SourceMethod source_method = SourceMethod::OCR;
    PipelineStage stage = PipelineStage::None;
    bool manual_entry = false;
};

std::string getScanStatusName(ScanStatus status);
std::string getSourceMethodName(SourceMethod method);
std::string getCandidateKindName(CandidateKind kind);
std::string getCandidateOriginName(CandidateOrigin origin);
std::string getRejectReasonName(RejectReason reason);
std::string getPipelineStageName(PipelineStage stage);

ScanOutcome createScanOutcome(const DetectionResult& result);
ScanOutcome createFailureOutcome(ScanStatus status);

#endif // IMEI_SCANNER_TYPES_H
