#include "decoder_adapter.h"

#include <iostream>

DecoderAdapter::DecoderAdapter(std::shared_ptr<DecodeCapability> barcode,
                               std::shared_ptr<DecodeCapability> matrix,
                               std::shared_ptr<DecodeCapability> text)
    : barcode_capability(barcode), matrix_capability(matrix), text_capability(text), failure_count(0) {
}

std::vector<DecodedPayload> DecoderAdapter::decodeBarcodes(const cv::Mat& gray_image) {
    return runIsolated(barcode_capability.get(), gray_image);
}

std::vector<DecodedPayload> DecoderAdapter::decodeMatrix(const cv::Mat& gray_image) {
    return runIsolated(matrix_capability.get(), gray_image);
}

std::vector<DecodedPayload> DecoderAdapter::recognizeText(const cv::Mat& gray_image) {
    return runIsolated(text_capability.get(), gray_image);
}

bool DecoderAdapter::hasTextRecognizer() const {
    return text_capability != nullptr;
}

int DecoderAdapter::failureCount() const {
    return failure_count;
}

std::vector<DecodedPayload> DecoderAdapter::runIsolated(DecodeCapability* capability, const cv::Mat& gray_image) {
    std::vector<DecodedPayload> payloads;
    if (!capability) return payloads;

    try {
        payloads = capability->decode(gray_image);
    } catch (const std::exception& e) {
        ++failure_count;
        std::cerr << "Error: " << capability->name() << " failed, treating as no result: " << e.what() << std::endl;
        payloads.clear();
    }

    // Blank payloads carry nothing to extract
    std::vector<DecodedPayload> non_empty;
    for (const auto& payload : payloads) {
        if (!payload.text.empty()) non_empty.push_back(payload);
    }
    return non_empty;
}
