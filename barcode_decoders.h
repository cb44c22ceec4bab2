#ifndef BARCODE_DECODERS_H
#define BARCODE_DECODERS_H

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

#include <ZXing/ReadBarcode.h>
#include <ZXing/BarcodeFormat.h>

#include "decoder_adapter.h"
#include "scanner_settings.h"

namespace zbar {
class ImageScanner;
} // end namespace zbar

// 1D and 2D barcodes: ZXing first, libdmtx for DataMatrix, zbar for 1D codes
// ZXing missed. Optionally repeated on the inverted image.
class ZXingBarcodeCapability : public DecodeCapability {
public:
    explicit ZXingBarcodeCapability(std::shared_ptr<ScannerSettings> settings);

    std::vector<DecodedPayload> decode(const cv::Mat& gray_image) override;
    std::string name() const override;

private:
    SymbologyType convertZXingFormat(ZXing::BarcodeFormat format) const;
    ZXing::BarcodeFormats createZXingFormats(const std::set<SymbologyType>& enabled_symbologies) const;
    std::vector<DecodedPayload> processImage(const cv::Mat& image);
    std::vector<DecodedPayload> processDataMatrix(const cv::Mat& image);
    std::vector<DecodedPayload> processZBar1D(const cv::Mat& image);

    std::shared_ptr<ScannerSettings> settings;
    std::shared_ptr<zbar::ImageScanner> linear_scanner;
};

// QR codes straight from the luminance matrix, zbar with every other symbology off.
class ZBarMatrixCapability : public DecodeCapability {
public:
    ZBarMatrixCapability();

    std::vector<DecodedPayload> decode(const cv::Mat& gray_image) override;
    std::string name() const override;

private:
    std::shared_ptr<zbar::ImageScanner> scanner;
};

bool isMatrixSymbology(SymbologyType symbology);

#endif // BARCODE_DECODERS_H
