#ifndef CAMERA_DEVICE_H
#define CAMERA_DEVICE_H

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/opencv.hpp>
#include <opencv2/videoio.hpp>

#include "imei_scanner_types.h"

// Zero means "no preference" for every field.
struct CameraConstraints {
    int width;
    int height;
    int min_width;
    int min_height;
    double frame_rate;
};

struct CameraInfo {
    std::string id;
    std::string label;
};

enum class PermissionState {
    Unknown,
    Granted,
    Denied,
    Prompt
};

enum class CameraFailure {
    PermissionDenied,
    DeviceNotFound,
    DeviceBusy,
    UnsupportedConstraints
};

class CameraError : public std::runtime_error {
public:
    CameraError(CameraFailure failure, const std::string& message);
    CameraFailure failure() const;

private:
    CameraFailure camera_failure;
};

ScanStatus classifyCameraFailure(CameraFailure failure);
std::string getCameraFailureName(CameraFailure failure);

enum class ReleaseStatus {
    Released,
    NothingHeld,
    ReleaseFailed
};

// One open media stream. The stream is released on release() or on destruction.
class CameraHandle {
public:
    virtual ~CameraHandle() = default;

    virtual const std::string& deviceId() const = 0;
    // false when no frame could be read
    virtual bool grabFrame(cv::Mat& frame) = 0;
    virtual ReleaseStatus release() = 0;
};

class CameraDevice {
public:
    virtual ~CameraDevice() = default;

    virtual PermissionState queryPermission() = 0;
    virtual bool requestPermission() = 0;
    virtual std::vector<CameraInfo> listCameras() = 0;
    // Throws CameraError when the stream cannot be opened with the constraints.
    virtual std::unique_ptr<CameraHandle> open(const std::string& camera_id, const CameraConstraints& constraints) = 0;
};

class OpenCvCameraHandle : public CameraHandle {
public:
    OpenCvCameraHandle(const std::string& camera_id, int index, const CameraConstraints& constraints);
    ~OpenCvCameraHandle() override;

    const std::string& deviceId() const override;
    bool grabFrame(cv::Mat& frame) override;
    ReleaseStatus release() override;

private:
    std::string camera_id;
    cv::VideoCapture capture;
};

// V4L2 cameras through cv::VideoCapture, addressed by index ("0", "1", ...).
class OpenCvCameraDevice : public CameraDevice {
public:
    explicit OpenCvCameraDevice(int probe_count);

    PermissionState queryPermission() override;
    bool requestPermission() override;
    std::vector<CameraInfo> listCameras() override;
    std::unique_ptr<CameraHandle> open(const std::string& camera_id, const CameraConstraints& constraints) override;

private:
    int probe_count;
};

#endif // CAMERA_DEVICE_H
