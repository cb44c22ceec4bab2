#include "camera_device.h"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <sys/stat.h>
#include <unistd.h>

CameraError::CameraError(CameraFailure failure, const std::string& message)
    : std::runtime_error(message), camera_failure(failure) {
}

CameraFailure CameraError::failure() const {
    return camera_failure;
}

ScanStatus classifyCameraFailure(CameraFailure failure) {
    switch (failure) {
        case CameraFailure::PermissionDenied:
            return SCAN_PERMISSION_DENIED;
        case CameraFailure::DeviceNotFound:
            return SCAN_DEVICE_NOT_FOUND;
        case CameraFailure::DeviceBusy:
            return SCAN_DEVICE_BUSY;
        case CameraFailure::UnsupportedConstraints:
            return SCAN_UNSUPPORTED_CONSTRAINTS;
    }
    return SCAN_DEVICE_NOT_FOUND;
}

std::string getCameraFailureName(CameraFailure failure) {
    switch (failure) {
        case CameraFailure::PermissionDenied: return "PermissionDenied";
        case CameraFailure::DeviceNotFound: return "DeviceNotFound";
        case CameraFailure::DeviceBusy: return "DeviceBusy";
        case CameraFailure::UnsupportedConstraints: return "UnsupportedConstraints";
        default: return "Unknown";
    }
}

static std::string devicePath(int index) {
    return "/dev/video" + std::to_string(index);
}

static bool deviceNodeExists(int index) {
    struct stat info;
    return stat(devicePath(index).c_str(), &info) == 0;
}

static bool deviceNodeAccessible(int index) {
    return access(devicePath(index).c_str(), R_OK | W_OK) == 0;
}

// Implementations for OpenCvCameraHandle class
OpenCvCameraHandle::OpenCvCameraHandle(const std::string& id, int index, const CameraConstraints& constraints)
    : camera_id(id) {

    if (!capture.open(index, cv::CAP_ANY)) {
        if (!deviceNodeExists(index)) {
            throw CameraError(CameraFailure::DeviceNotFound, "No camera at " + devicePath(index));
        }
        throw CameraError(CameraFailure::DeviceBusy, "Camera " + devicePath(index) + " could not be opened");
    }

    if (constraints.width > 0) capture.set(cv::CAP_PROP_FRAME_WIDTH, constraints.width);
    if (constraints.height > 0) capture.set(cv::CAP_PROP_FRAME_HEIGHT, constraints.height);
    if (constraints.frame_rate > 0) capture.set(cv::CAP_PROP_FPS, constraints.frame_rate);

    int actual_width = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_WIDTH));
    int actual_height = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_HEIGHT));
    if (actual_width < constraints.min_width || actual_height < constraints.min_height) {
        capture.release();
        throw CameraError(CameraFailure::UnsupportedConstraints,
                          "Camera delivers " + std::to_string(actual_width) + "x" + std::to_string(actual_height) +
                          ", below required " + std::to_string(constraints.min_width) + "x" +
                          std::to_string(constraints.min_height));
    }

    // A device held by another process opens but never delivers frames
    cv::Mat probe;
    if (!capture.read(probe) || probe.empty()) {
        capture.release();
        throw CameraError(CameraFailure::DeviceBusy, "Camera " + devicePath(index) + " is in use");
    }

    std::cout << "Camera " << camera_id << " opened at " << actual_width << "x" << actual_height << std::endl;
}

OpenCvCameraHandle::~OpenCvCameraHandle() {
    release();
}

const std::string& OpenCvCameraHandle::deviceId() const {
    return camera_id;
}

bool OpenCvCameraHandle::grabFrame(cv::Mat& frame) {
    if (!capture.isOpened()) return false;
    return capture.read(frame) && !frame.empty();
}

ReleaseStatus OpenCvCameraHandle::release() {
    if (!capture.isOpened()) {
        return ReleaseStatus::NothingHeld;
    }
    capture.release();
    if (capture.isOpened()) {
        return ReleaseStatus::ReleaseFailed;
    }
    std::cout << "Camera " << camera_id << " released" << std::endl;
    return ReleaseStatus::Released;
}

// Implementations for OpenCvCameraDevice class
OpenCvCameraDevice::OpenCvCameraDevice(int probe) : probe_count(probe) {
}

PermissionState OpenCvCameraDevice::queryPermission() {
    bool any_node = false;
    for (int i = 0; i < probe_count; ++i) {
        if (!deviceNodeExists(i)) continue;
        any_node = true;
        if (deviceNodeAccessible(i)) {
            return PermissionState::Granted;
        }
    }
    // Without device nodes there is nothing to ask about; enumeration reports the absence
    return any_node ? PermissionState::Denied : PermissionState::Unknown;
}

bool OpenCvCameraDevice::requestPermission() {
    // Device node permissions cannot be granted interactively
    return queryPermission() != PermissionState::Denied;
}

std::vector<CameraInfo> OpenCvCameraDevice::listCameras() {
    std::vector<CameraInfo> cameras;
    for (int i = 0; i < probe_count; ++i) {
        if (deviceNodeExists(i)) {
            cameras.push_back({std::to_string(i), "Camera " + std::to_string(i) + " (" + devicePath(i) + ")"});
        }
    }
    return cameras;
}

std::unique_ptr<CameraHandle> OpenCvCameraDevice::open(const std::string& camera_id,
                                                        const CameraConstraints& constraints) {
    int index = -1;
    try {
        index = std::stoi(camera_id);
    } catch (const std::exception&) {
        throw CameraError(CameraFailure::DeviceNotFound, "Invalid camera id: " + camera_id);
    }

    if (deviceNodeExists(index) && !deviceNodeAccessible(index)) {
        throw CameraError(CameraFailure::PermissionDenied, "No access to " + devicePath(index) + ": " +
                          std::string(std::strerror(errno)));
    }

    return std::make_unique<OpenCvCameraHandle>(camera_id, index, constraints);
}
