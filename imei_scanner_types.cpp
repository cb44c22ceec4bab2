#include "imei_scanner_types.h"

static bool containsValue(const std::vector<IdentifierCandidate>& candidates, const std::string& value) {
    for (const auto& candidate : candidates) {
        if (candidate.value == value) {
            return true;
        }
    }
    return false;
}

void CandidateSet::append(const CandidateSet& other) {
    for (const auto& candidate : other.imei_candidates) {
        if (!containsValue(imei_candidates, candidate.value)) {
            imei_candidates.push_back(candidate);
        }
    }
    for (const auto& candidate : other.mobile_candidates) {
        if (!containsValue(mobile_candidates, candidate.value)) {
            mobile_candidates.push_back(candidate);
        }
    }
}

bool CandidateSet::empty() const {
    return imei_candidates.empty() && mobile_candidates.empty();
}

std::string getScanStatusName(ScanStatus status) {
    switch (status) {
        case SCAN_SUCCESS: return "Success";
        case SCAN_PERMISSION_DENIED: return "PermissionDenied";
        case SCAN_DEVICE_NOT_FOUND: return "DeviceNotFound";
        case SCAN_DEVICE_BUSY: return "DeviceBusy";
        case SCAN_UNSUPPORTED_CONSTRAINTS: return "UnsupportedConstraints";
        case SCAN_NO_IDENTIFIER_FOUND: return "NoIdentifierFound";
        case SCAN_VALIDATION_FAILED: return "ValidationFailed";
        case SCAN_TRANSIENT_DECODER_ERROR: return "TransientDecoderError";
        case SCAN_INVALID_IMAGE: return "InvalidImage";
        default: return "Unknown";
    }
}

std::string getSourceMethodName(SourceMethod method) {
    switch (method) {
        case SourceMethod::Barcode1D: return "Barcode1D";
        case SourceMethod::Barcode2D: return "Barcode2D";
        case SourceMethod::RawMatrix: return "RawMatrix";
        case SourceMethod::OCR: return "OCR";
        default: return "Unknown";
    }
}

std::string getCandidateKindName(CandidateKind kind) {
    return kind == CandidateKind::Imei ? "IMEI" : "Mobile";
}

std::string getCandidateOriginName(CandidateOrigin origin) {
    switch (origin) {
        case CandidateOrigin::Labeled: return "Labeled";
        case CandidateOrigin::Unlabeled: return "Unlabeled";
        case CandidateOrigin::JsonWalk: return "JsonWalk";
        default: return "Unknown";
    }
}

std::string getRejectReasonName(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "None";
        case RejectReason::BadLength: return "BadLength";
        case RejectReason::BadChecksum: return "BadChecksum";
        case RejectReason::Denylisted: return "Denylisted";
        default: return "Unknown";
    }
}

std::string getPipelineStageName(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::None: return "None";
        case PipelineStage::DirectBarcode: return "DirectBarcode";
        case PipelineStage::DirectOcr: return "DirectOcr";
        case PipelineStage::DirectMatrix: return "DirectMatrix";
        case PipelineStage::EnhancedBarcode: return "EnhancedBarcode";
        case PipelineStage::EnhancedMatrix: return "EnhancedMatrix";
        case PipelineStage::ResizedBarcode: return "ResizedBarcode";
        case PipelineStage::ResizedMatrix: return "ResizedMatrix";
        case PipelineStage::ComprehensiveOcr: return "ComprehensiveOcr";
        default: return "Unknown";
    }
}

ScanOutcome createScanOutcome(const DetectionResult& result) {
    ScanOutcome outcome;
    outcome.status = result.resolution.status;
    outcome.identifier = result.resolution.hasIdentifier() ? result.resolution.candidate.value : "";
    outcome.kind = result.resolution.candidate.kind;
    outcome.origin = result.resolution.candidate.origin;
    outcome.source_method = result.resolution.candidate.source_method;
    outcome.stage = result.stage;
    outcome.manual_entry = false;
    return outcome;
}

ScanOutcome createFailureOutcome(ScanStatus status) {
    ScanOutcome outcome;
    outcome.status = status;
    return outcome;
}
