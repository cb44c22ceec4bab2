#ifndef SCANNER_SETTINGS_H
#define SCANNER_SETTINGS_H

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "camera_device.h"

enum ScanPreset {
    PRESET_UPLOAD_MODE,
    PRESET_REALTIME_MODE
};

enum class SymbologyType {
    None,
    Code128,
    Code39,
    Code93,
    EAN,
    EAN13,
    EAN8,
    UPCA,
    UPCE,
    ITF,
    DataMatrix,
    QRCode,
    PDF417,
    Aztec
};

// Scanner, pipeline and session tuning in one place
class ScannerSettings {
private:
    ScanPreset preset_mode;
    std::map<SymbologyType, bool> enabled_symbologies;
    std::map<SymbologyType, bool> color_inverted;
    int max_codes_per_frame;
    bool try_harder_mode;

    double contrast_gain;
    int resize_side;
    bool ocr_enabled;
    std::string ocr_language;
    std::string ocr_data_path;

    int scan_interval_ms;
    int error_retry_interval_ms;
    int scan_timeout_ms;

    int camera_probe_count;
    std::string preferred_camera_id;
    std::vector<CameraConstraints> camera_constraints;

public:
    explicit ScannerSettings(ScanPreset preset = PRESET_UPLOAD_MODE);

    void setSymbologyEnabled(SymbologyType symbology, bool enabled);
    void setColorInvertedEnabled(SymbologyType symbology, bool enabled);
    void setMaxCodesPerFrame(int max_codes);
    void setTryHarderMode(bool try_harder);
    std::set<SymbologyType> getEnabledSymbologies() const;
    bool isSymbologyEnabled(SymbologyType symbology) const;
    bool isColorInverted(SymbologyType symbology) const;
    bool isAnyColorInverted() const;
    int getMaxCodesPerFrame() const;
    bool getTryHarderMode() const;
    ScanPreset getPresetMode() const;

    void setContrastGain(double gain);
    void setResizeSide(int side);
    void setOcrEnabled(bool enabled);
    void setOcrLanguage(const std::string& language);
    void setOcrDataPath(const std::string& path);
    double getContrastGain() const;
    int getResizeSide() const;
    bool getOcrEnabled() const;
    const std::string& getOcrLanguage() const;
    const std::string& getOcrDataPath() const;

    void setScanIntervalMs(int interval_ms);
    void setErrorRetryIntervalMs(int interval_ms);
    void setScanTimeoutMs(int timeout_ms);
    int getScanIntervalMs() const;
    int getErrorRetryIntervalMs() const;
    int getScanTimeoutMs() const;

    void setCameraProbeCount(int count);
    void setPreferredCameraId(const std::string& camera_id);
    void setCameraConstraints(const std::vector<CameraConstraints>& constraints);
    int getCameraProbeCount() const;
    const std::string& getPreferredCameraId() const;
    const std::vector<CameraConstraints>& getCameraConstraints() const;
};

std::string getSymbologyName(SymbologyType symbology);

std::shared_ptr<ScannerSettings> createScannerSettings(ScanPreset preset = PRESET_UPLOAD_MODE);
void configureScannerForPhonePackaging(std::shared_ptr<ScannerSettings> settings);

// Ideal 1280x720 at 30 fps down to no constraints at all.
std::vector<CameraConstraints> defaultCameraConstraints();

#endif // SCANNER_SETTINGS_H
