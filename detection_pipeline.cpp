#include "detection_pipeline.h"

#include <iostream>

#include "barcode_decoders.h"
#include "identifier_resolver.h"
#include "image_preprocessing.h"
#include "imei_validator.h"
#include "text_recognizer.h"

bool isOcrStage(PipelineStage stage) {
    return stage == PipelineStage::DirectOcr || stage == PipelineStage::ComprehensiveOcr;
}

DetectionPipeline::DetectionPipeline(std::shared_ptr<DecoderAdapter> adapt, std::shared_ptr<ScannerSettings> sett)
    : adapter(adapt), settings(sett) {

    if (!adapter || !settings) {
        throw std::runtime_error("Detection pipeline needs a decoder adapter and settings");
    }
}

const std::vector<PipelineStage>& DetectionPipeline::stageOrder() {
    static const std::vector<PipelineStage> stages = {
        PipelineStage::DirectBarcode,
        PipelineStage::DirectOcr,
        PipelineStage::DirectMatrix,
        PipelineStage::EnhancedBarcode,
        PipelineStage::EnhancedMatrix,
        PipelineStage::ResizedBarcode,
        PipelineStage::ResizedMatrix,
        PipelineStage::ComprehensiveOcr
    };
    return stages;
}

DetectionResult DetectionPipeline::run(const cv::Mat& image) {
    DetectionResult result;

    if (image.empty()) {
        std::cout << "Error: Invalid image data" << std::endl;
        result.resolution.status = SCAN_INVALID_IMAGE;
        return result;
    }

    std::cout << "Processing frame: " << image.cols << "x" << image.rows
              << " (" << image.channels() << " channels)" << std::endl;

    enhanced.release();
    resized.release();
    cv::Mat gray = toGrayscale(image);

    for (PipelineStage stage : stageOrder()) {
        if (isOcrStage(stage) && !settings->getOcrEnabled()) continue;

        std::vector<DecodedPayload> payloads = runStage(stage, gray);
        ++result.attempts;

        for (const auto& payload : payloads) {
            CandidateSet found = extractor.extract(payload.text, payload.source_method);
            result.candidates.append(found);

            const IdentifierCandidate* accepted = findFirstAcceptedImei(found.imei_candidates);
            if (accepted) {
                result.resolution.status = SCAN_SUCCESS;
                result.resolution.candidate = *accepted;
                result.stage = stage;
                std::cout << "Accepted IMEI " << accepted->value << " at stage " << getPipelineStageName(stage)
                          << " (" << getSourceMethodName(payload.source_method) << ", "
                          << getCandidateOriginName(accepted->origin) << ")" << std::endl;
                return result;
            }
        }
    }

    result.resolution = resolveIdentifier(result.candidates);
    if (result.resolution.status == SCAN_VALIDATION_FAILED) {
        ValidationResult check = validateCandidate(result.resolution.candidate);
        std::cout << "No IMEI passed validation, returning " << result.resolution.candidate.value
                  << " (" << getRejectReasonName(check.reject_reason) << ")" << std::endl;
    }
    std::cout << "Pipeline finished after " << result.attempts << " attempt(s): "
              << getScanStatusName(result.resolution.status) << std::endl;
    return result;
}

std::vector<DecodedPayload> DetectionPipeline::runStage(PipelineStage stage, const cv::Mat& gray) {
    switch (stage) {
        case PipelineStage::DirectBarcode:
            return adapter->decodeBarcodes(gray);
        case PipelineStage::DirectOcr:
            return adapter->recognizeText(gray);
        case PipelineStage::DirectMatrix:
            return adapter->decodeMatrix(gray);
        case PipelineStage::EnhancedBarcode:
            return adapter->decodeBarcodes(enhancedImage(gray));
        case PipelineStage::EnhancedMatrix:
            return adapter->decodeMatrix(enhancedImage(gray));
        case PipelineStage::ResizedBarcode:
            return adapter->decodeBarcodes(resizedImage(gray));
        case PipelineStage::ResizedMatrix:
            return adapter->decodeMatrix(resizedImage(gray));
        case PipelineStage::ComprehensiveOcr:
            return adapter->recognizeText(binarize(enhancedImage(gray)));
        default:
            return std::vector<DecodedPayload>();
    }
}

const cv::Mat& DetectionPipeline::enhancedImage(const cv::Mat& gray) {
    if (enhanced.empty()) {
        enhanced = enhanceContrast(gray, settings->getContrastGain());
    }
    return enhanced;
}

const cv::Mat& DetectionPipeline::resizedImage(const cv::Mat& gray) {
    if (resized.empty()) {
        resized = resizeToSquare(gray, settings->getResizeSide());
    }
    return resized;
}

std::shared_ptr<DetectionPipeline> createDetectionPipeline(std::shared_ptr<ScannerSettings> settings) {
    auto barcode = std::make_shared<ZXingBarcodeCapability>(settings);
    auto matrix = std::make_shared<ZBarMatrixCapability>();

    std::shared_ptr<DecodeCapability> text;
    if (settings->getOcrEnabled()) {
        try {
            text = std::make_shared<TesseractTextCapability>(settings->getOcrDataPath(), settings->getOcrLanguage());
        } catch (const std::runtime_error& e) {
            std::cerr << "Error: " << e.what() << "; continuing without OCR" << std::endl;
            settings->setOcrEnabled(false);
        }
    }

    auto adapter = std::make_shared<DecoderAdapter>(barcode, matrix, text);
    return std::make_shared<DetectionPipeline>(adapter, settings);
}
