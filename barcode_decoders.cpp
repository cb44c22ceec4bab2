#include "barcode_decoders.h"

#include <iostream>

#include <zbar.h>

extern "C" {
#include <dmtx.h>
}

#include "image_preprocessing.h"

// libdmtx gives up on an image after this long
const int DATAMATRIX_TIMEOUT_MS = 2000;
const int DATAMATRIX_MAX_REGIONS = 10;

static cv::Mat continuousCopy(const cv::Mat& image) {
    return image.isContinuous() ? image : image.clone();
}

static bool containsText(const std::vector<DecodedPayload>& payloads, const std::string& text) {
    for (const auto& payload : payloads) {
        if (payload.text == text) return true;
    }
    return false;
}

static void appendUnique(std::vector<DecodedPayload>& payloads, const std::vector<DecodedPayload>& more) {
    for (const auto& payload : more) {
        if (!containsText(payloads, payload.text)) payloads.push_back(payload);
    }
}

bool isMatrixSymbology(SymbologyType symbology) {
    return symbology == SymbologyType::DataMatrix ||
           symbology == SymbologyType::QRCode ||
           symbology == SymbologyType::Aztec ||
           symbology == SymbologyType::PDF417;
}

// Implementations for ZXingBarcodeCapability class
ZXingBarcodeCapability::ZXingBarcodeCapability(std::shared_ptr<ScannerSettings> sett)
    : settings(sett), linear_scanner(std::make_shared<zbar::ImageScanner>()) {

    if (!settings) {
        throw std::runtime_error("Invalid scanner settings");
    }

    // Linear symbologies only; QR codes are the matrix capability's job
    linear_scanner->set_config(zbar::ZBAR_NONE, zbar::ZBAR_CFG_ENABLE, 1);
    linear_scanner->set_config(zbar::ZBAR_QRCODE, zbar::ZBAR_CFG_ENABLE, 0);
}

std::string ZXingBarcodeCapability::name() const {
    return "ZXing barcode reader";
}

std::vector<DecodedPayload> ZXingBarcodeCapability::decode(const cv::Mat& gray_image) {
    std::vector<DecodedPayload> results = processImage(gray_image);

    if (settings->isAnyColorInverted()) {
        appendUnique(results, processImage(invertImage(gray_image)));
    }

    std::cout << "Barcode decode found " << results.size() << " payload(s)" << std::endl;
    return results;
}

SymbologyType ZXingBarcodeCapability::convertZXingFormat(ZXing::BarcodeFormat format) const {
    switch (format) {
        case ZXing::BarcodeFormat::QRCode:
            return SymbologyType::QRCode;
        case ZXing::BarcodeFormat::DataMatrix:
            return SymbologyType::DataMatrix;
        case ZXing::BarcodeFormat::Aztec:
            return SymbologyType::Aztec;
        case ZXing::BarcodeFormat::PDF417:
            return SymbologyType::PDF417;
        case ZXing::BarcodeFormat::EAN13:
            return SymbologyType::EAN13;
        case ZXing::BarcodeFormat::EAN8:
            return SymbologyType::EAN8;
        case ZXing::BarcodeFormat::UPCA:
            return SymbologyType::UPCA;
        case ZXing::BarcodeFormat::UPCE:
            return SymbologyType::UPCE;
        case ZXing::BarcodeFormat::ITF:
            return SymbologyType::ITF;
        case ZXing::BarcodeFormat::Code39:
            return SymbologyType::Code39;
        case ZXing::BarcodeFormat::Code93:
            return SymbologyType::Code93;
        case ZXing::BarcodeFormat::Code128:
            return SymbologyType::Code128;
        default:
            return SymbologyType::None;
    }
}

ZXing::BarcodeFormats ZXingBarcodeCapability::createZXingFormats(const std::set<SymbologyType>& enabled_symbologies) const {
    ZXing::BarcodeFormats formats;
    for (const auto& symbology : enabled_symbologies) {
        switch (symbology) {
            case SymbologyType::QRCode:
                formats |= ZXing::BarcodeFormat::QRCode;
                break;
            case SymbologyType::DataMatrix:
                formats |= ZXing::BarcodeFormat::DataMatrix;
                break;
            case SymbologyType::Aztec:
                formats |= ZXing::BarcodeFormat::Aztec;
                break;
            case SymbologyType::PDF417:
                formats |= ZXing::BarcodeFormat::PDF417;
                break;
            case SymbologyType::EAN:
                formats |= ZXing::BarcodeFormat::EAN13;
                formats |= ZXing::BarcodeFormat::EAN8;
                break;
            case SymbologyType::EAN13:
                formats |= ZXing::BarcodeFormat::EAN13;
                break;
            case SymbologyType::EAN8:
                formats |= ZXing::BarcodeFormat::EAN8;
                break;
            case SymbologyType::UPCA:
                formats |= ZXing::BarcodeFormat::UPCA;
                break;
            case SymbologyType::UPCE:
                formats |= ZXing::BarcodeFormat::UPCE;
                break;
            case SymbologyType::ITF:
                formats |= ZXing::BarcodeFormat::ITF;
                break;
            case SymbologyType::Code39:
                formats |= ZXing::BarcodeFormat::Code39;
                break;
            case SymbologyType::Code93:
                formats |= ZXing::BarcodeFormat::Code93;
                break;
            case SymbologyType::Code128:
                formats |= ZXing::BarcodeFormat::Code128;
                break;
            default:
                break;
        }
    }
    return formats;
}

std::vector<DecodedPayload> ZXingBarcodeCapability::processImage(const cv::Mat& image) {
    std::vector<DecodedPayload> results;

    ZXing::ImageView view(image.data, image.cols, image.rows, ZXing::ImageFormat::Lum, static_cast<int>(image.step));

    ZXing::ReaderOptions options;
    options.setTryHarder(settings->getTryHarderMode());
    options.setTryRotate(true);
    options.setMaxNumberOfSymbols(settings->getMaxCodesPerFrame());
    options.setFormats(createZXingFormats(settings->getEnabledSymbologies()));

    auto barcodes = ZXing::ReadBarcodes(view, options);

    for (const auto& barcode : barcodes) {
        if (!barcode.isValid() || barcode.text().empty()) continue;

        SymbologyType symbology = convertZXingFormat(barcode.format());
        DecodedPayload payload;
        payload.text = barcode.text();
        payload.source_method = isMatrixSymbology(symbology) ? SourceMethod::Barcode2D : SourceMethod::Barcode1D;
        payload.format_name = ZXing::ToString(barcode.format());
        if (!containsText(results, payload.text)) results.push_back(payload);
    }

    if (settings->isSymbologyEnabled(SymbologyType::DataMatrix)) {
        appendUnique(results, processDataMatrix(image));
    }

    if (results.empty()) {
        results = processZBar1D(image);
    }

    return results;
}

std::vector<DecodedPayload> ZXingBarcodeCapability::processDataMatrix(const cv::Mat& image) {
    std::vector<DecodedPayload> results;
    cv::Mat buffer = continuousCopy(image);

    DmtxImage* img = dmtxImageCreate(buffer.data, buffer.cols, buffer.rows, DmtxPack8bppK);
    if (!img) return results;

    DmtxDecode* dec = dmtxDecodeCreate(img, 1);
    if (!dec) {
        dmtxImageDestroy(&img);
        return results;
    }

    DmtxTime timeout = dmtxTimeAdd(dmtxTimeNow(), DATAMATRIX_TIMEOUT_MS);

    for (int i = 0; i < DATAMATRIX_MAX_REGIONS; i++) {
        DmtxRegion* reg = dmtxRegionFindNext(dec, &timeout);
        if (!reg) break;

        DmtxMessage* msg = dmtxDecodeMatrixRegion(dec, reg, DmtxUndefined);
        if (msg) {
            if (msg->output != nullptr && msg->outputSize > 0) {
                DecodedPayload payload;
                payload.text = std::string(reinterpret_cast<char*>(msg->output), msg->outputSize);
                payload.source_method = SourceMethod::Barcode2D;
                payload.format_name = "DataMatrix";
                results.push_back(payload);
            }
            dmtxMessageDestroy(&msg);
        }

        dmtxRegionDestroy(&reg);
    }

    dmtxDecodeDestroy(&dec);
    dmtxImageDestroy(&img);

    return results;
}

std::vector<DecodedPayload> ZXingBarcodeCapability::processZBar1D(const cv::Mat& image) {
    std::vector<DecodedPayload> results;
    cv::Mat buffer = continuousCopy(image);

    zbar::Image zbar_image(buffer.cols, buffer.rows, "Y800", buffer.data, buffer.cols * buffer.rows);

    int n = linear_scanner->scan(zbar_image);
    if (n > 0) {
        for (zbar::Image::SymbolIterator symbol = zbar_image.symbol_begin(); symbol != zbar_image.symbol_end(); ++symbol) {
            DecodedPayload payload;
            payload.text = symbol->get_data();
            payload.source_method = SourceMethod::Barcode1D;
            payload.format_name = symbol->get_type_name();
            if (!payload.text.empty() && !containsText(results, payload.text)) results.push_back(payload);
        }
    }
    return results;
}

// Implementations for ZBarMatrixCapability class
ZBarMatrixCapability::ZBarMatrixCapability()
    : scanner(std::make_shared<zbar::ImageScanner>()) {
    scanner->set_config(zbar::ZBAR_NONE, zbar::ZBAR_CFG_ENABLE, 0);
    scanner->set_config(zbar::ZBAR_QRCODE, zbar::ZBAR_CFG_ENABLE, 1);
}

std::string ZBarMatrixCapability::name() const {
    return "zbar QR matrix reader";
}

std::vector<DecodedPayload> ZBarMatrixCapability::decode(const cv::Mat& gray_image) {
    std::vector<DecodedPayload> results;
    cv::Mat buffer = continuousCopy(gray_image);

    zbar::Image zbar_image(buffer.cols, buffer.rows, "Y800", buffer.data, buffer.cols * buffer.rows);
    scanner->scan(zbar_image);

    for (zbar::Image::SymbolIterator symbol = zbar_image.symbol_begin(); symbol != zbar_image.symbol_end(); ++symbol) {
        DecodedPayload payload;
        payload.text = symbol->get_data();
        payload.source_method = SourceMethod::RawMatrix;
        payload.format_name = "QRCode";
        if (!payload.text.empty() && !containsText(results, payload.text)) results.push_back(payload);
    }

    std::cout << "Matrix decode found " << results.size() << " payload(s)" << std::endl;
    return results;
}
