#include "scanner_settings.h"

#include <iostream>

// Implementations for ScannerSettings class
ScannerSettings::ScannerSettings(ScanPreset preset)
    : preset_mode(preset),
      max_codes_per_frame(preset == PRESET_REALTIME_MODE ? 4 : 10),
      try_harder_mode(preset != PRESET_REALTIME_MODE),
      contrast_gain(1.5),
      resize_side(400),
      ocr_enabled(true),
      ocr_language("eng"),
      scan_interval_ms(2000),
      error_retry_interval_ms(3000),
      scan_timeout_ms(30000),
      camera_probe_count(4),
      camera_constraints(defaultCameraConstraints()) {
    // Initialize all symbologies to false
    for (int i = 0; i < static_cast<int>(SymbologyType::Aztec) + 1; ++i) {
        enabled_symbologies[static_cast<SymbologyType>(i)] = false;
        color_inverted[static_cast<SymbologyType>(i)] = false;
    }
}

void ScannerSettings::setSymbologyEnabled(SymbologyType symbology, bool enabled) {
    enabled_symbologies[symbology] = enabled;
}

void ScannerSettings::setColorInvertedEnabled(SymbologyType symbology, bool enabled) {
    color_inverted[symbology] = enabled;
}

void ScannerSettings::setMaxCodesPerFrame(int max_codes) {
    max_codes_per_frame = max_codes;
}

void ScannerSettings::setTryHarderMode(bool try_harder) {
    try_harder_mode = try_harder;
}

std::set<SymbologyType> ScannerSettings::getEnabledSymbologies() const {
    std::set<SymbologyType> enabled;
    for (const auto& pair : enabled_symbologies) {
        if (pair.second) {
            enabled.insert(pair.first);
        }
    }
    return enabled;
}

bool ScannerSettings::isSymbologyEnabled(SymbologyType symbology) const {
    auto it = enabled_symbologies.find(symbology);
    return it != enabled_symbologies.end() && it->second;
}

bool ScannerSettings::isColorInverted(SymbologyType symbology) const {
    auto it = color_inverted.find(symbology);
    return it != color_inverted.end() && it->second;
}

bool ScannerSettings::isAnyColorInverted() const {
    for (const auto& pair : color_inverted) {
        if (pair.second) return true;
    }
    return false;
}

int ScannerSettings::getMaxCodesPerFrame() const {
    return max_codes_per_frame;
}

bool ScannerSettings::getTryHarderMode() const {
    return try_harder_mode;
}

ScanPreset ScannerSettings::getPresetMode() const {
    return preset_mode;
}

void ScannerSettings::setContrastGain(double gain) {
    contrast_gain = gain;
}

void ScannerSettings::setResizeSide(int side) {
    resize_side = side;
}

void ScannerSettings::setOcrEnabled(bool enabled) {
    ocr_enabled = enabled;
}

void ScannerSettings::setOcrLanguage(const std::string& language) {
    ocr_language = language;
}

void ScannerSettings::setOcrDataPath(const std::string& path) {
    ocr_data_path = path;
}

double ScannerSettings::getContrastGain() const {
    return contrast_gain;
}

int ScannerSettings::getResizeSide() const {
    return resize_side;
}

bool ScannerSettings::getOcrEnabled() const {
    return ocr_enabled;
}

const std::string& ScannerSettings::getOcrLanguage() const {
    return ocr_language;
}

const std::string& ScannerSettings::getOcrDataPath() const {
    return ocr_data_path;
}

void ScannerSettings::setScanIntervalMs(int interval_ms) {
    scan_interval_ms = interval_ms;
}

void ScannerSettings::setErrorRetryIntervalMs(int interval_ms) {
    error_retry_interval_ms = interval_ms;
}

void ScannerSettings::setScanTimeoutMs(int timeout_ms) {
    scan_timeout_ms = timeout_ms;
}

int ScannerSettings::getScanIntervalMs() const {
    return scan_interval_ms;
}

int ScannerSettings::getErrorRetryIntervalMs() const {
    return error_retry_interval_ms;
}

int ScannerSettings::getScanTimeoutMs() const {
    return scan_timeout_ms;
}

void ScannerSettings::setCameraProbeCount(int count) {
    camera_probe_count = count;
}

void ScannerSettings::setPreferredCameraId(const std::string& camera_id) {
    preferred_camera_id = camera_id;
}

void ScannerSettings::setCameraConstraints(const std::vector<CameraConstraints>& constraints) {
    camera_constraints = constraints;
}

int ScannerSettings::getCameraProbeCount() const {
    return camera_probe_count;
}

const std::string& ScannerSettings::getPreferredCameraId() const {
    return preferred_camera_id;
}

const std::vector<CameraConstraints>& ScannerSettings::getCameraConstraints() const {
    return camera_constraints;
}

std::string getSymbologyName(SymbologyType symbology) {
    switch (symbology) {
        case SymbologyType::QRCode: return "QR";
        case SymbologyType::DataMatrix: return "DataMatrix";
        case SymbologyType::Aztec: return "Aztec";
        case SymbologyType::PDF417: return "PDF417";
        case SymbologyType::EAN: return "EAN";
        case SymbologyType::Code39: return "Code39";
        case SymbologyType::Code93: return "Code93";
        case SymbologyType::Code128: return "Code128";
        case SymbologyType::UPCA: return "UPCA";
        case SymbologyType::UPCE: return "UPCE";
        case SymbologyType::ITF: return "ITF";
        case SymbologyType::EAN8: return "EAN8";
        case SymbologyType::EAN13: return "EAN13";
        default: return "Unknown";
    }
}

std::shared_ptr<ScannerSettings> createScannerSettings(ScanPreset preset) {
    return std::make_shared<ScannerSettings>(preset);
}

void configureScannerForPhonePackaging(std::shared_ptr<ScannerSettings> settings) {
    std::cout << "\n=== CONFIGURING SCANNER FOR PHONE PACKAGING ===" << std::endl;

    // IMEI labels carry Code128, product barcodes are EAN/UPC
    settings->setSymbologyEnabled(SymbologyType::Code128, true);
    settings->setSymbologyEnabled(SymbologyType::Code39, true);
    settings->setSymbologyEnabled(SymbologyType::EAN13, true);
    settings->setSymbologyEnabled(SymbologyType::EAN8, true);
    settings->setSymbologyEnabled(SymbologyType::UPCA, true);
    settings->setSymbologyEnabled(SymbologyType::ITF, true);
    settings->setSymbologyEnabled(SymbologyType::DataMatrix, true);
    settings->setSymbologyEnabled(SymbologyType::QRCode, true);

    // Glossy boxes often print light-on-dark labels
    settings->setColorInvertedEnabled(SymbologyType::Code128, true);

    std::cout << "Scanner configured for phone packaging ("
              << (settings->getPresetMode() == PRESET_REALTIME_MODE ? "realtime" : "upload") << " preset)"
              << std::endl;
    std::cout << "Enabled symbologies:";
    for (const auto& symbology : settings->getEnabledSymbologies()) {
        std::cout << " " << getSymbologyName(symbology);
        if (settings->isColorInverted(symbology)) std::cout << "(inverted)";
    }
    std::cout << std::endl;
}

std::vector<CameraConstraints> defaultCameraConstraints() {
    std::vector<CameraConstraints> constraints;
    constraints.push_back({1280, 720, 640, 480, 30.0});
    constraints.push_back({1280, 720, 0, 0, 0.0});
    constraints.push_back({640, 480, 0, 0, 15.0});
    constraints.push_back({0, 0, 0, 0, 0.0});
    return constraints;
}
