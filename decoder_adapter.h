#ifndef DECODER_ADAPTER_H
#define DECODER_ADAPTER_H

#include <memory>
#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

#include "imei_scanner_types.h"

// One external decode capability (barcode reader, QR matrix reader, OCR engine).
// An empty result means "nothing decoded"; implementations may throw.
class DecodeCapability {
public:
    virtual ~DecodeCapability() = default;

    virtual std::vector<DecodedPayload> decode(const cv::Mat& gray_image) = 0;
    virtual std::string name() const = 0;
};

// Boundary between the pipeline and the decode libraries. A capability that
// throws, or was never configured, yields no payloads for that call only.
class DecoderAdapter {
public:
    DecoderAdapter(std::shared_ptr<DecodeCapability> barcode,
                   std::shared_ptr<DecodeCapability> matrix,
                   std::shared_ptr<DecodeCapability> text);

    std::vector<DecodedPayload> decodeBarcodes(const cv::Mat& gray_image);
    std::vector<DecodedPayload> decodeMatrix(const cv::Mat& gray_image);
    std::vector<DecodedPayload> recognizeText(const cv::Mat& gray_image);

    bool hasTextRecognizer() const;
    int failureCount() const;

private:
    std::vector<DecodedPayload> runIsolated(DecodeCapability* capability, const cv::Mat& gray_image);

    std::shared_ptr<DecodeCapability> barcode_capability;
    std::shared_ptr<DecodeCapability> matrix_capability;
    std::shared_ptr<DecodeCapability> text_capability;
    int failure_count;
};

#endif // DECODER_ADAPTER_H
