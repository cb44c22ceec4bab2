#ifndef SCAN_SESSION_H
#define SCAN_SESSION_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

#include "camera_device.h"
#include "detection_pipeline.h"
#include "event_loop.h"
#include "imei_scanner_types.h"
#include "pipeline_executor.h"
#include "scanner_settings.h"

enum class ScanMode {
    Camera,
    Upload
};

enum class SessionState {
    Idle,
    RequestingPermission,
    Initializing,
    Active,
    SwitchingCamera,
    EmergencyStopped,
    Error
};

struct TeardownReport {
    ReleaseStatus camera = ReleaseStatus::NothingHeld;
    int timers_cancelled = 0;
    bool surface_cleared = false;
};

class ScanSessionListener {
public:
    virtual ~ScanSessionListener() = default;

    // SCAN_SUCCESS, or SCAN_VALIDATION_FAILED for the lenient IMEI fallback
    virtual void onIdentifierResolved(const ScanOutcome& outcome) = 0;
    virtual void onScanFailed(ScanStatus status, const std::string& message) = 0;
    virtual void onStateChanged(SessionState state, ScanMode mode) {}
};

// Owns the camera and the live scan loop for one scanning interaction.
//
//   Idle -> RequestingPermission -> Initializing -> Active -> Idle
//                                        |            |-> SwitchingCamera -> Active
//                                        +-> Error <--+
//   any state -> EmergencyStopped -> (acknowledgeEmergencyStop) -> Idle
//
// At most one CameraHandle is open at a time. Every exit path runs the same
// idempotent teardown: timers cancelled, camera released, decode surface
// cleared. Work that was already started when the session moved on is
// detected by epoch and dropped when it reports back.
//
// The event loop must outlive the session.
class ScanSession {
public:
    ScanSession(std::shared_ptr<ScannerSettings> settings,
                std::shared_ptr<CameraDevice> camera_device,
                std::shared_ptr<DetectionPipeline> pipeline,
                std::shared_ptr<PipelineExecutor> executor,
                EventLoop& loop,
                ScanSessionListener* listener);
    ~ScanSession();

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    // Camera mode only, from Idle or Error. Permission and camera setup
    // continue on later loop turns.
    bool startCamera();
    void stop();
    void emergencyStop();
    bool acknowledgeEmergencyStop();

    bool switchToUploadMode();
    bool switchToCameraMode();
    bool switchCamera(const std::string& camera_id);

    // Upload mode only; throws std::logic_error otherwise.
    ScanOutcome processUpload(const cv::Mat& image);
    ScanOutcome processUploadFile(const std::string& path);

    // Operator-typed value, delivered without validation.
    ScanOutcome submitManualEntry(const std::string& text);

    SessionState state() const;
    ScanMode mode() const;
    int errorCount() const;
    bool hasOpenCamera() const;
    std::string activeCameraId() const;
    bool isPipelineInFlight() const;
    ScanStatus lastError() const;
    const TeardownReport& lastTeardown() const;

private:
    typedef void (ScanSession::*Step)(std::uint64_t);

    EventLoop::Task guard(std::function<void()> body) const;
    void postStep(Step step);
    void setState(SessionState state);
    TeardownReport teardown();
    void fail(ScanStatus status, const std::string& message);
    void deliver(const ScanOutcome& outcome, const std::string& message);
    bool isCurrent(std::uint64_t epoch) const;

    void requestPermissionStep(std::uint64_t epoch);
    void initializeCameraStep(std::uint64_t epoch);
    std::string selectCamera(const std::vector<CameraInfo>& cameras) const;
    bool acquireCamera(const std::string& camera_id);
    void enterActive();
    void scheduleLiveIteration(int delay_ms);
    void runLiveIteration(std::uint64_t epoch);
    void onLiveResult(std::uint64_t epoch, const DetectionResult& result);
    void onScanTimeout(std::uint64_t epoch);

    std::shared_ptr<ScannerSettings> settings;
    std::shared_ptr<CameraDevice> camera_device;
    std::shared_ptr<DetectionPipeline> pipeline;
    std::shared_ptr<PipelineExecutor> executor;
    EventLoop& loop;
    ScanSessionListener* listener;

    ScanMode scan_mode;
    SessionState session_state;
    std::unique_ptr<CameraHandle> camera_handle;
    cv::Mat decode_surface;
    TimerHandle scan_timeout_timer;
    TimerHandle live_loop_timer;
    int error_count;
    ScanStatus last_error;
    TeardownReport last_teardown;

    std::uint64_t session_epoch;
    bool stop_processing;
    bool pipeline_in_flight;
    std::string requested_camera_id;
    bool has_fallback;
    ScanOutcome fallback_outcome;

    // a camera switch resumes the running scan instead of starting a new one
    std::chrono::milliseconds scan_deadline;
    bool keep_scan_deadline;

    // weak copies travel with posted callbacks
    std::shared_ptr<bool> lifetime_token;
};

// Runs the pipeline, turning an escaping exception into SCAN_TRANSIENT_DECODER_ERROR.
DetectionResult runPipelineGuarded(DetectionPipeline& pipeline, const cv::Mat& image);

std::string getSessionStateName(SessionState state);
std::string getScanModeName(ScanMode mode);

#endif // SCAN_SESSION_H
