#ifndef DETECTION_PIPELINE_H
#define DETECTION_PIPELINE_H

#include <memory>
#include <vector>

#include <opencv2/opencv.hpp>

#include "candidate_extractor.h"
#include "decoder_adapter.h"
#include "imei_scanner_types.h"
#include "scanner_settings.h"

// Escalating decode attempts over one still image:
//
//   DirectBarcode -> DirectOcr -> DirectMatrix            (original image)
//   EnhancedBarcode -> EnhancedMatrix                     (contrast gain)
//   ResizedBarcode -> ResizedMatrix                       (fixed square)
//   ComprehensiveOcr                                      (enhanced + Otsu)
//
// Every payload goes through extraction and validation immediately. The run
// stops at the first stage that yields an accepted IMEI; otherwise the
// resolver picks from everything collected.
class DetectionPipeline {
public:
    DetectionPipeline(std::shared_ptr<DecoderAdapter> adapter, std::shared_ptr<ScannerSettings> settings);

    DetectionResult run(const cv::Mat& image);

    static const std::vector<PipelineStage>& stageOrder();

private:
    std::vector<DecodedPayload> runStage(PipelineStage stage, const cv::Mat& gray);
    const cv::Mat& enhancedImage(const cv::Mat& gray);
    const cv::Mat& resizedImage(const cv::Mat& gray);

    std::shared_ptr<DecoderAdapter> adapter;
    std::shared_ptr<ScannerSettings> settings;
    CandidateExtractor extractor;

    // per-run preprocessing cache, built only when a stage needs it
    cv::Mat enhanced;
    cv::Mat resized;
};

bool isOcrStage(PipelineStage stage);

// Wires the ZXing, zbar and tesseract capabilities. OCR is left out, with a
// message, when tesseract cannot load its language data.
std::shared_ptr<DetectionPipeline> createDetectionPipeline(std::shared_ptr<ScannerSettings> settings);

#endif // DETECTION_PIPELINE_H
