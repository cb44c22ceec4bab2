#include "scan_session.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace {

std::string toLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    std::size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    std::size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

bool isFrontFacing(const CameraInfo& camera) {
    std::string label = toLower(camera.label);
    return label.find("front") != std::string::npos ||
           label.find("facing") != std::string::npos ||
           label.find("user") != std::string::npos;
}

bool containsCamera(const std::vector<CameraInfo>& cameras, const std::string& camera_id) {
    for (const auto& camera : cameras) {
        if (camera.id == camera_id) return true;
    }
    return false;
}

} // namespace

DetectionResult runPipelineGuarded(DetectionPipeline& pipeline, const cv::Mat& image) {
    try {
        return pipeline.run(image);
    } catch (const std::exception& e) {
        std::cerr << "Error: Pipeline run failed: " << e.what() << std::endl;
        DetectionResult result;
        result.resolution.status = SCAN_TRANSIENT_DECODER_ERROR;
        return result;
    }
}

std::string getSessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::RequestingPermission: return "RequestingPermission";
        case SessionState::Initializing: return "Initializing";
        case SessionState::Active: return "Active";
        case SessionState::SwitchingCamera: return "SwitchingCamera";
        case SessionState::EmergencyStopped: return "EmergencyStopped";
        case SessionState::Error: return "Error";
        default: return "Unknown";
    }
}

std::string getScanModeName(ScanMode mode) {
    switch (mode) {
        case ScanMode::Camera: return "Camera";
        case ScanMode::Upload: return "Upload";
        default: return "Unknown";
    }
}

// Implementations for ScanSession class
ScanSession::ScanSession(std::shared_ptr<ScannerSettings> sett,
                         std::shared_ptr<CameraDevice> device,
                         std::shared_ptr<DetectionPipeline> pipe,
                         std::shared_ptr<PipelineExecutor> exec,
                         EventLoop& event_loop,
                         ScanSessionListener* session_listener)
    : settings(sett), camera_device(device), pipeline(pipe), executor(exec),
      loop(event_loop), listener(session_listener),
      scan_mode(ScanMode::Camera), session_state(SessionState::Idle),
      error_count(0), last_error(SCAN_SUCCESS),
      session_epoch(0), stop_processing(true), pipeline_in_flight(false),
      has_fallback(false), scan_deadline(0), keep_scan_deadline(false),
      lifetime_token(std::make_shared<bool>(true)) {

    if (!settings || !camera_device || !pipeline || !executor) {
        throw std::runtime_error("Scan session needs settings, a camera device, a pipeline and an executor");
    }
}

ScanSession::~ScanSession() {
    teardown();
}

EventLoop::Task ScanSession::guard(std::function<void()> body) const {
    std::weak_ptr<bool> alive = lifetime_token;
    return [alive, body]() {
        if (!alive.expired()) body();
    };
}

void ScanSession::postStep(Step step) {
    std::uint64_t epoch = session_epoch;
    loop.post(guard([this, step, epoch]() { (this->*step)(epoch); }));
}

bool ScanSession::isCurrent(std::uint64_t epoch) const {
    return epoch == session_epoch;
}

void ScanSession::setState(SessionState state) {
    if (state != session_state) {
        std::cout << "Scanner state: " << getSessionStateName(session_state)
                  << " -> " << getSessionStateName(state) << std::endl;
    }
    session_state = state;
    if (listener) listener->onStateChanged(session_state, scan_mode);
}

TeardownReport ScanSession::teardown() {
    TeardownReport report;

    if (live_loop_timer.reset()) ++report.timers_cancelled;
    if (scan_timeout_timer.reset()) ++report.timers_cancelled;

    if (camera_handle) {
        report.camera = camera_handle->release();
        if (report.camera == ReleaseStatus::ReleaseFailed) {
            std::cerr << "Error: Camera " << camera_handle->deviceId() << " did not release cleanly" << std::endl;
        }
        camera_handle.reset();
    }

    if (!decode_surface.empty()) {
        decode_surface.release();
        report.surface_cleared = true;
    }

    stop_processing = true;
    pipeline_in_flight = false;
    has_fallback = false;
    fallback_outcome = ScanOutcome();
    ++session_epoch;

    last_teardown = report;
    return report;
}

void ScanSession::fail(ScanStatus status, const std::string& message) {
    std::cerr << "Error: " << message << " (" << getScanStatusName(status) << ")" << std::endl;
    teardown();
    last_error = status;
    setState(SessionState::Error);
    if (listener) listener->onScanFailed(status, message);
}

void ScanSession::deliver(const ScanOutcome& outcome, const std::string& message) {
    if (outcome.status == SCAN_SUCCESS || outcome.status == SCAN_VALIDATION_FAILED) {
        std::cout << "Identifier: " << outcome.identifier
                  << " (" << getScanStatusName(outcome.status) << ")" << std::endl;
        if (listener) listener->onIdentifierResolved(outcome);
    } else {
        last_error = outcome.status;
        if (listener) listener->onScanFailed(outcome.status, message);
    }
}

bool ScanSession::startCamera() {
    if (scan_mode != ScanMode::Camera) {
        std::cout << "Camera start ignored in " << getScanModeName(scan_mode) << " mode" << std::endl;
        return false;
    }
    if (session_state != SessionState::Idle && session_state != SessionState::Error) {
        std::cout << "Camera start ignored while " << getSessionStateName(session_state) << std::endl;
        return false;
    }

    teardown();
    keep_scan_deadline = false;
    error_count = 0;
    last_error = SCAN_SUCCESS;
    setState(SessionState::RequestingPermission);
    postStep(&ScanSession::requestPermissionStep);
    return true;
}

void ScanSession::stop() {
    if (session_state == SessionState::EmergencyStopped) {
        std::cout << "Emergency stop must be acknowledged before stopping" << std::endl;
        return;
    }
    teardown();
    setState(SessionState::Idle);
}

void ScanSession::emergencyStop() {
    TeardownReport report = teardown();
    std::cout << "Emergency stop: " << report.timers_cancelled << " timer(s) cancelled, camera "
              << (report.camera == ReleaseStatus::Released ? "released" : "not held") << std::endl;
    setState(SessionState::EmergencyStopped);
}

bool ScanSession::acknowledgeEmergencyStop() {
    if (session_state != SessionState::EmergencyStopped) return false;
    setState(SessionState::Idle);
    return true;
}

bool ScanSession::switchToUploadMode() {
    if (session_state == SessionState::EmergencyStopped) return false;

    teardown();
    scan_mode = ScanMode::Upload;
    setState(SessionState::Idle);
    return true;
}

bool ScanSession::switchToCameraMode() {
    if (session_state == SessionState::EmergencyStopped) return false;

    teardown();
    scan_mode = ScanMode::Camera;
    setState(SessionState::Idle);
    return startCamera();
}

bool ScanSession::switchCamera(const std::string& camera_id) {
    if (scan_mode != ScanMode::Camera || session_state != SessionState::Active) {
        std::cout << "Camera switch ignored while " << getSessionStateName(session_state) << std::endl;
        return false;
    }
    if (!containsCamera(camera_device->listCameras(), camera_id)) {
        std::cout << "Camera switch ignored: no camera " << camera_id << std::endl;
        return false;
    }

    bool had_fallback = has_fallback;
    ScanOutcome kept_fallback = fallback_outcome;
    teardown();
    has_fallback = had_fallback;
    fallback_outcome = kept_fallback;
    keep_scan_deadline = true;
    requested_camera_id = camera_id;
    setState(SessionState::SwitchingCamera);
    postStep(&ScanSession::initializeCameraStep);
    return true;
}

void ScanSession::requestPermissionStep(std::uint64_t epoch) {
    if (!isCurrent(epoch) || session_state != SessionState::RequestingPermission) return;

    PermissionState permission = camera_device->queryPermission();
    if (permission == PermissionState::Denied) {
        fail(SCAN_PERMISSION_DENIED, "Camera permission denied");
        return;
    }

    if (permission == PermissionState::Prompt) {
        bool granted = false;
        try {
            granted = camera_device->requestPermission();
        } catch (const CameraError& e) {
            fail(classifyCameraFailure(e.failure()), e.what());
            return;
        }
        if (!granted) {
            fail(SCAN_PERMISSION_DENIED, "Camera permission denied");
            return;
        }
    }

    setState(SessionState::Initializing);
    postStep(&ScanSession::initializeCameraStep);
}

void ScanSession::initializeCameraStep(std::uint64_t epoch) {
    if (!isCurrent(epoch)) return;
    if (session_state != SessionState::Initializing && session_state != SessionState::SwitchingCamera) return;

    std::vector<CameraInfo> cameras = camera_device->listCameras();
    std::cout << "Found " << cameras.size() << " camera(s)" << std::endl;
    if (cameras.empty()) {
        fail(SCAN_DEVICE_NOT_FOUND, "No camera found");
        return;
    }

    std::string camera_id = selectCamera(cameras);
    if (!acquireCamera(camera_id)) return;

    enterActive();
}

std::string ScanSession::selectCamera(const std::vector<CameraInfo>& cameras) const {
    if (!requested_camera_id.empty() && containsCamera(cameras, requested_camera_id)) {
        return requested_camera_id;
    }

    const std::string& preferred = settings->getPreferredCameraId();
    if (!preferred.empty() && containsCamera(cameras, preferred)) {
        return preferred;
    }

    for (const auto& camera : cameras) {
        if (isFrontFacing(camera)) return camera.id;
    }
    return cameras.front().id;
}

bool ScanSession::acquireCamera(const std::string& camera_id) {
    if (camera_handle) {
        std::cout << "Releasing camera " << camera_handle->deviceId() << " before opening " << camera_id << std::endl;
        camera_handle->release();
        camera_handle.reset();
    }

    std::vector<CameraConstraints> options = settings->getCameraConstraints();
    if (options.empty()) {
        options.push_back(CameraConstraints{0, 0, 0, 0, 0.0});
    }

    CameraFailure last_failure = CameraFailure::DeviceNotFound;
    std::string last_message = "Camera " + camera_id + " could not be opened";

    for (std::size_t i = 0; i < options.size(); ++i) {
        try {
            camera_handle = camera_device->open(camera_id, options[i]);
            if (camera_handle) {
                std::cout << "Camera " << camera_id << " started with constraint option "
                          << (i + 1) << " of " << options.size() << std::endl;
                return true;
            }
        } catch (const CameraError& e) {
            last_failure = e.failure();
            last_message = e.what();
        } catch (const std::exception& e) {
            last_failure = CameraFailure::DeviceBusy;
            last_message = e.what();
        }
        std::cout << "Constraint option " << (i + 1) << " failed (" << getCameraFailureName(last_failure)
                  << "): " << last_message << std::endl;
    }

    fail(classifyCameraFailure(last_failure), last_message);
    return false;
}

void ScanSession::enterActive() {
    stop_processing = false;
    pipeline_in_flight = false;
    if (!keep_scan_deadline) {
        has_fallback = false;
        scan_deadline = loop.now() + std::chrono::milliseconds(settings->getScanTimeoutMs());
    }
    keep_scan_deadline = false;
    setState(SessionState::Active);

    std::chrono::milliseconds remaining = scan_deadline - loop.now();
    if (remaining < std::chrono::milliseconds(0)) remaining = std::chrono::milliseconds(0);

    std::uint64_t epoch = session_epoch;
    scan_timeout_timer = TimerHandle(&loop, loop.schedule(
        remaining, guard([this, epoch]() { onScanTimeout(epoch); })));

    scheduleLiveIteration(settings->getScanIntervalMs());
}

void ScanSession::scheduleLiveIteration(int delay_ms) {
    std::uint64_t epoch = session_epoch;
    live_loop_timer = TimerHandle(&loop, loop.schedule(
        std::chrono::milliseconds(delay_ms),
        guard([this, epoch]() { runLiveIteration(epoch); })));
}

void ScanSession::runLiveIteration(std::uint64_t epoch) {
    if (!isCurrent(epoch) || session_state != SessionState::Active || stop_processing) return;

    if (pipeline_in_flight) {
        std::cout << "Pipeline still running, skipping frame" << std::endl;
        scheduleLiveIteration(settings->getScanIntervalMs());
        return;
    }

    cv::Mat frame;
    if (!camera_handle || !camera_handle->grabFrame(frame) || frame.empty()) {
        ++error_count;
        std::cerr << "Error: Could not read a frame (" << error_count << " error(s))" << std::endl;
        scheduleLiveIteration(settings->getErrorRetryIntervalMs());
        return;
    }

    decode_surface = frame;
    pipeline_in_flight = true;
    scheduleLiveIteration(settings->getScanIntervalMs());

    std::shared_ptr<DetectionPipeline> job_pipeline = pipeline;
    cv::Mat job_frame = frame.clone();
    std::weak_ptr<bool> alive = lifetime_token;
    executor->submit(
        [job_pipeline, job_frame]() { return runPipelineGuarded(*job_pipeline, job_frame); },
        [this, alive, epoch](const DetectionResult& result) {
            if (alive.expired()) return;
            onLiveResult(epoch, result);
        });
}

void ScanSession::onLiveResult(std::uint64_t epoch, const DetectionResult& result) {
    if (!isCurrent(epoch)) {
        std::cout << "Discarding result from a finished scan" << std::endl;
        return;
    }
    pipeline_in_flight = false;
    if (session_state != SessionState::Active || stop_processing) {
        std::cout << "Discarding result after stop" << std::endl;
        return;
    }

    switch (result.resolution.status) {
        case SCAN_SUCCESS: {
            ScanOutcome outcome = createScanOutcome(result);
            stop_processing = true;
            teardown();
            setState(SessionState::Idle);
            deliver(outcome, "");
            break;
        }
        case SCAN_VALIDATION_FAILED:
            if (!has_fallback) {
                fallback_outcome = createScanOutcome(result);
                has_fallback = true;
                std::cout << "Holding unvalidated candidate " << fallback_outcome.identifier
                          << " until the scan times out" << std::endl;
            }
            break;
        case SCAN_TRANSIENT_DECODER_ERROR:
            ++error_count;
            scheduleLiveIteration(settings->getErrorRetryIntervalMs());
            break;
        default:
            break;
    }
}

void ScanSession::onScanTimeout(std::uint64_t epoch) {
    if (!isCurrent(epoch) || session_state != SessionState::Active) return;

    stop_processing = true;
    if (has_fallback) {
        ScanOutcome outcome = fallback_outcome;
        teardown();
        setState(SessionState::Idle);
        deliver(outcome, "");
        return;
    }

    fail(SCAN_NO_IDENTIFIER_FOUND,
         "No identifier found within " + std::to_string(settings->getScanTimeoutMs() / 1000) + " seconds");
}

ScanOutcome ScanSession::processUpload(const cv::Mat& image) {
    if (scan_mode != ScanMode::Upload) {
        throw std::logic_error("Image upload requires upload mode");
    }
    if (session_state == SessionState::EmergencyStopped) {
        throw std::logic_error("Image upload blocked until the emergency stop is acknowledged");
    }

    decode_surface = image;
    DetectionResult result = runPipelineGuarded(*pipeline, image);
    decode_surface.release();

    ScanOutcome outcome = createScanOutcome(result);
    if (outcome.status == SCAN_TRANSIENT_DECODER_ERROR) ++error_count;
    deliver(outcome, "No IMEI found in the image (" + getScanStatusName(outcome.status) + ")");
    return outcome;
}

ScanOutcome ScanSession::processUploadFile(const std::string& path) {
    if (scan_mode != ScanMode::Upload) {
        throw std::logic_error("Image upload requires upload mode");
    }

    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        ScanOutcome outcome = createFailureOutcome(SCAN_INVALID_IMAGE);
        deliver(outcome, "Could not load image: " + path);
        return outcome;
    }

    std::cout << "Loaded image: " << path << std::endl;
    return processUpload(image);
}

ScanOutcome ScanSession::submitManualEntry(const std::string& text) {
    if (session_state == SessionState::EmergencyStopped) {
        throw std::logic_error("Manual entry blocked until the emergency stop is acknowledged");
    }

    if (session_state != SessionState::Idle && session_state != SessionState::Error) {
        teardown();
        setState(SessionState::Idle);
    }

    std::string value = trim(text);
    if (value.empty()) {
        ScanOutcome outcome = createFailureOutcome(SCAN_NO_IDENTIFIER_FOUND);
        deliver(outcome, "Manual entry is empty");
        return outcome;
    }

    ScanOutcome outcome;
    outcome.status = SCAN_SUCCESS;
    outcome.identifier = value;
    outcome.manual_entry = true;
    deliver(outcome, "");
    return outcome;
}

SessionState ScanSession::state() const {
    return session_state;
}

ScanMode ScanSession::mode() const {
    return scan_mode;
}

int ScanSession::errorCount() const {
    return error_count;
}

bool ScanSession::hasOpenCamera() const {
    return camera_handle != nullptr;
}

std::string ScanSession::activeCameraId() const {
    return camera_handle ? camera_handle->deviceId() : std::string();
}

bool ScanSession::isPipelineInFlight() const {
    return pipeline_in_flight;
}

ScanStatus ScanSession::lastError() const {
    return last_error;
}

const TeardownReport& ScanSession::lastTeardown() const {
    return last_teardown;
}
