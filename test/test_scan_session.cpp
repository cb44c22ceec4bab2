#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

#include "scan_session.h"
#include "test_fakes.h"

using std::chrono::milliseconds;

class ScanSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings = createScannerSettings(PRESET_REALTIME_MODE);
        settings->setOcrEnabled(false);
        device = std::make_shared<FakeCameraDevice>();
        barcode = std::make_shared<FakeCapability>("barcode");
        auto adapter = std::make_shared<DecoderAdapter>(barcode, nullptr, nullptr);
        pipeline = std::make_shared<DetectionPipeline>(adapter, settings);
        executor = std::make_shared<ManualExecutor>();
        session.reset(new ScanSession(settings, device, pipeline, executor, loop, &listener));
    }

    void startActive() {
        ASSERT_TRUE(session->startCamera());
        loop.runPending();
        ASSERT_EQ(SessionState::Active, session->state());
    }

    CameraStats& stats() { return *device->stats; }

    EventLoop loop;
    RecordingListener listener;
    std::shared_ptr<ScannerSettings> settings;
    std::shared_ptr<FakeCameraDevice> device;
    std::shared_ptr<FakeCapability> barcode;
    std::shared_ptr<DetectionPipeline> pipeline;
    std::shared_ptr<ManualExecutor> executor;
    std::unique_ptr<ScanSession> session;
};

TEST_F(ScanSessionTest, StartGoesThroughPermissionAndInitialization) {
    ASSERT_TRUE(session->startCamera());
    EXPECT_EQ(SessionState::RequestingPermission, session->state());
    EXPECT_EQ(0, stats().open_attempts);

    loop.runPending();

    std::vector<SessionState> expected = {
        SessionState::RequestingPermission, SessionState::Initializing, SessionState::Active
    };
    EXPECT_EQ(expected, listener.states);
    EXPECT_TRUE(session->hasOpenCamera());
    EXPECT_EQ("0", session->activeCameraId());
    EXPECT_EQ(1, stats().open_handles);
}

TEST_F(ScanSessionTest, StartIsIgnoredWhileRunning) {
    startActive();

    EXPECT_FALSE(session->startCamera());
    loop.runPending();
    EXPECT_EQ(1, stats().open_attempts);
}

TEST_F(ScanSessionTest, ModeSwitchingNeverHoldsTwoCameras) {
    startActive();

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(session->switchToUploadMode());
        EXPECT_EQ(ScanMode::Upload, session->mode());
        EXPECT_FALSE(session->hasOpenCamera());
        EXPECT_EQ(0, stats().open_handles);
        EXPECT_FALSE(session->startCamera());

        ASSERT_TRUE(session->switchToCameraMode());
        EXPECT_EQ(ScanMode::Camera, session->mode());
        loop.runPending();
        EXPECT_EQ(SessionState::Active, session->state());
        EXPECT_EQ(1, stats().open_handles);
    }

    EXPECT_EQ(1, stats().max_open_handles);
}

TEST_F(ScanSessionTest, PermissionDenied) {
    device->permission = PermissionState::Denied;

    session->startCamera();
    loop.runPending();

    EXPECT_EQ(SessionState::Error, session->state());
    EXPECT_EQ(SCAN_PERMISSION_DENIED, session->lastError());
    ASSERT_EQ(1u, listener.failures.size());
    EXPECT_EQ(SCAN_PERMISSION_DENIED, listener.failures[0]);
    EXPECT_EQ(0, stats().open_attempts);
}

TEST_F(ScanSessionTest, PermissionPromptRefused) {
    device->permission = PermissionState::Prompt;
    device->grant_on_request = false;

    session->startCamera();
    loop.runPending();

    EXPECT_EQ(1, device->permission_requests);
    EXPECT_EQ(SCAN_PERMISSION_DENIED, session->lastError());
    EXPECT_FALSE(session->hasOpenCamera());
}

TEST_F(ScanSessionTest, PermissionPromptGranted) {
    device->permission = PermissionState::Prompt;

    startActive();
    EXPECT_EQ(1, device->permission_requests);
}

TEST_F(ScanSessionTest, NoCameraAvailable) {
    device->cameras.clear();

    session->startCamera();
    loop.runPending();

    EXPECT_EQ(SessionState::Error, session->state());
    EXPECT_EQ(SCAN_DEVICE_NOT_FOUND, session->lastError());
}

TEST_F(ScanSessionTest, FallsBackThroughConstraintOptions) {
    device->failing_opens = 2;

    startActive();

    EXPECT_EQ(3, stats().open_attempts);
    ASSERT_EQ(3u, stats().attempted_constraints.size());
    EXPECT_EQ(1280, stats().attempted_constraints[0].width);
    EXPECT_EQ(640, stats().attempted_constraints[2].width);
    EXPECT_EQ(1, stats().open_handles);
}

TEST_F(ScanSessionTest, ExhaustedConstraintsReportLastFailure) {
    device->failing_opens = 100;
    device->open_failure = CameraFailure::DeviceBusy;

    session->startCamera();
    loop.runPending();

    EXPECT_EQ(SessionState::Error, session->state());
    EXPECT_EQ(SCAN_DEVICE_BUSY, session->lastError());
    EXPECT_EQ(static_cast<int>(settings->getCameraConstraints().size()), stats().open_attempts);
    EXPECT_EQ(0, stats().open_handles);
    ASSERT_EQ(1u, listener.messages.size());
    EXPECT_EQ("fake camera refused to open", listener.messages[0]);

    // A later start from Error may succeed
    device->failing_opens = 0;
    startActive();
}

TEST_F(ScanSessionTest, PrefersFrontFacingCamera) {
    device->cameras.push_back(CameraInfo{"1", "Integrated Front Camera"});

    startActive();
    EXPECT_EQ("1", session->activeCameraId());
}

TEST_F(ScanSessionTest, ConfiguredCameraWinsOverLabel) {
    device->cameras.push_back(CameraInfo{"1", "Integrated Front Camera"});
    settings->setPreferredCameraId("0");

    startActive();
    EXPECT_EQ("0", session->activeCameraId());
}

TEST_F(ScanSessionTest, SwitchCameraReleasesBeforeReopening) {
    device->cameras.push_back(CameraInfo{"1", "user facing"});
    startActive();
    ASSERT_EQ("1", session->activeCameraId());

    ASSERT_TRUE(session->switchCamera("0"));
    EXPECT_EQ(SessionState::SwitchingCamera, session->state());
    EXPECT_FALSE(session->hasOpenCamera());

    loop.runPending();
    EXPECT_EQ(SessionState::Active, session->state());
    EXPECT_EQ("0", session->activeCameraId());
    EXPECT_EQ(1, stats().max_open_handles);

    EXPECT_FALSE(session->switchCamera("7"));
    EXPECT_EQ("0", session->activeCameraId());
}

TEST_F(ScanSessionTest, SwitchingCameraKeepsScanDeadline) {
    executor->run_immediately = true;
    device->cameras.push_back(CameraInfo{"1", "user facing"});
    startActive();

    loop.advance(milliseconds(20000));
    ASSERT_TRUE(session->switchCamera("0"));
    loop.runPending();
    ASSERT_EQ(SessionState::Active, session->state());

    loop.advance(milliseconds(9999));
    EXPECT_TRUE(listener.failures.empty());

    loop.advance(milliseconds(1));
    ASSERT_EQ(1u, listener.failures.size());
    EXPECT_EQ(SCAN_NO_IDENTIFIER_FOUND, listener.failures[0]);
    EXPECT_EQ(0, stats().open_handles);
}

TEST_F(ScanSessionTest, SwitchingCameraKeepsUnverifiedImei) {
    executor->run_immediately = true;
    device->cameras.push_back(CameraInfo{"1", "user facing"});
    barcode->repeat({makePayload("IMEI: 354626223546263")});
    startActive();

    loop.advance(milliseconds(2000));
    barcode->repeat({});
    ASSERT_TRUE(session->switchCamera("0"));
    loop.runPending();

    loop.advance(milliseconds(28000));
    ASSERT_EQ(1u, listener.resolved.size());
    EXPECT_EQ(SCAN_VALIDATION_FAILED, listener.resolved[0].status);
    EXPECT_EQ("354626223546263", listener.resolved[0].identifier);
}

TEST_F(ScanSessionTest, LiveSuccessDeliversAndTearsDown) {
    barcode->enqueue({makePayload("354626223546262")});
    startActive();

    loop.advance(milliseconds(1999));
    EXPECT_EQ(0, stats().frames_grabbed);

    loop.advance(milliseconds(1));
    EXPECT_EQ(1, stats().frames_grabbed);
    EXPECT_TRUE(session->isPipelineInFlight());
    ASSERT_EQ(1u, executor->pendingCount());

    executor->runNext();

    ASSERT_EQ(1u, listener.resolved.size());
    EXPECT_EQ(SCAN_SUCCESS, listener.resolved[0].status);
    EXPECT_EQ("354626223546262", listener.resolved[0].identifier);
    EXPECT_EQ(PipelineStage::DirectBarcode, listener.resolved[0].stage);
    EXPECT_EQ(SessionState::Idle, session->state());
    EXPECT_EQ(0, stats().open_handles);
    EXPECT_EQ(0u, loop.pendingCount());
}

TEST_F(ScanSessionTest, SkipsFramesWhilePipelineRuns) {
    startActive();

    loop.advance(milliseconds(2000));
    EXPECT_EQ(1, executor->submitted);

    loop.advance(milliseconds(2000));
    EXPECT_EQ(1, stats().frames_grabbed);
    EXPECT_EQ(1, executor->submitted);

    executor->runNext();
    EXPECT_FALSE(session->isPipelineInFlight());

    loop.advance(milliseconds(2000));
    EXPECT_EQ(2, stats().frames_grabbed);
    EXPECT_EQ(2, executor->submitted);
}

TEST_F(ScanSessionTest, ResultAfterStopIsDiscarded) {
    startActive();
    loop.advance(milliseconds(2000));

    session->stop();
    barcode->enqueue({makePayload("354626223546262")});
    executor->runNext();

    EXPECT_TRUE(listener.resolved.empty());
    EXPECT_EQ(SessionState::Idle, session->state());
}

TEST_F(ScanSessionTest, ResultFromEarlierScanIsDiscardedAfterRestart) {
    startActive();
    loop.advance(milliseconds(2000));

    session->stop();
    startActive();

    barcode->enqueue({makePayload("354626223546262")});
    executor->runNext();

    EXPECT_TRUE(listener.resolved.empty());
    EXPECT_EQ(SessionState::Active, session->state());

    // The restarted scan is not blocked by the stale job
    loop.advance(milliseconds(2000));
    EXPECT_EQ(2, executor->submitted);
}

TEST_F(ScanSessionTest, TimeoutWithoutCandidateFails) {
    executor->run_immediately = true;
    startActive();

    loop.advance(milliseconds(29999));
    EXPECT_TRUE(listener.failures.empty());
    EXPECT_EQ(SessionState::Active, session->state());

    loop.advance(milliseconds(1));
    ASSERT_EQ(1u, listener.failures.size());
    EXPECT_EQ(SCAN_NO_IDENTIFIER_FOUND, listener.failures[0]);
    EXPECT_EQ(SessionState::Error, session->state());
    EXPECT_EQ(0, stats().open_handles);
    EXPECT_EQ(0u, loop.pendingCount());
    EXPECT_EQ(14, stats().frames_grabbed);
}

TEST_F(ScanSessionTest, TimeoutDeliversUnverifiedImei) {
    executor->run_immediately = true;
    barcode->repeat({makePayload("IMEI: 354626223546263")});
    startActive();

    loop.advance(milliseconds(2000));
    EXPECT_TRUE(listener.resolved.empty());
    EXPECT_EQ(SessionState::Active, session->state());

    loop.advance(milliseconds(28000));
    ASSERT_EQ(1u, listener.resolved.size());
    EXPECT_EQ(SCAN_VALIDATION_FAILED, listener.resolved[0].status);
    EXPECT_EQ("354626223546263", listener.resolved[0].identifier);
    EXPECT_TRUE(listener.failures.empty());
    EXPECT_EQ(SessionState::Idle, session->state());
}

TEST_F(ScanSessionTest, FrameGrabFailureBacksOff) {
    stats().fail_grabs = true;
    startActive();

    loop.advance(milliseconds(2000));
    EXPECT_EQ(1, session->errorCount());

    loop.advance(milliseconds(2999));
    EXPECT_EQ(1, session->errorCount());

    loop.advance(milliseconds(1));
    EXPECT_EQ(2, session->errorCount());
    EXPECT_EQ(SessionState::Active, session->state());
}

TEST_F(ScanSessionTest, PipelineErrorBacksOff) {
    executor->run_immediately = true;
    executor->replacement = []() {
        DetectionResult result;
        result.resolution.status = SCAN_TRANSIENT_DECODER_ERROR;
        return result;
    };
    startActive();

    loop.advance(milliseconds(2000));
    EXPECT_EQ(1, session->errorCount());
    EXPECT_EQ(1, stats().frames_grabbed);

    loop.advance(milliseconds(2999));
    EXPECT_EQ(1, stats().frames_grabbed);

    loop.advance(milliseconds(1));
    EXPECT_EQ(2, stats().frames_grabbed);
    EXPECT_EQ(2, session->errorCount());
}

TEST_F(ScanSessionTest, EmergencyStopHaltsEverything) {
    startActive();
    loop.advance(milliseconds(2000));

    session->emergencyStop();

    EXPECT_EQ(SessionState::EmergencyStopped, session->state());
    EXPECT_EQ(0, stats().open_handles);
    EXPECT_EQ(ReleaseStatus::Released, session->lastTeardown().camera);
    EXPECT_EQ(2, session->lastTeardown().timers_cancelled);
    EXPECT_TRUE(session->lastTeardown().surface_cleared);
    EXPECT_EQ(0u, loop.pendingCount());

    barcode->enqueue({makePayload("354626223546262")});
    executor->runNext();
    EXPECT_TRUE(listener.resolved.empty());

    EXPECT_FALSE(session->startCamera());
    session->stop();
    EXPECT_EQ(SessionState::EmergencyStopped, session->state());
    EXPECT_FALSE(session->switchToUploadMode());
    EXPECT_THROW(session->submitManualEntry("354626223546262"), std::logic_error);

    EXPECT_TRUE(session->acknowledgeEmergencyStop());
    EXPECT_EQ(SessionState::Idle, session->state());
    EXPECT_FALSE(session->acknowledgeEmergencyStop());
    startActive();
}

TEST_F(ScanSessionTest, TeardownIsIdempotent) {
    startActive();

    session->stop();
    EXPECT_EQ(ReleaseStatus::Released, session->lastTeardown().camera);

    session->stop();
    EXPECT_EQ(ReleaseStatus::NothingHeld, session->lastTeardown().camera);
    EXPECT_EQ(0, session->lastTeardown().timers_cancelled);
    EXPECT_FALSE(session->lastTeardown().surface_cleared);
    EXPECT_EQ(SessionState::Idle, session->state());
}

TEST_F(ScanSessionTest, ManualEntryStopsCameraAndSkipsValidation) {
    startActive();

    ScanOutcome outcome = session->submitManualEntry("  354626223546263 ");

    EXPECT_EQ(SCAN_SUCCESS, outcome.status);
    EXPECT_EQ("354626223546263", outcome.identifier);
    EXPECT_TRUE(outcome.manual_entry);
    EXPECT_EQ(SessionState::Idle, session->state());
    EXPECT_EQ(0, stats().open_handles);
    ASSERT_EQ(1u, listener.resolved.size());
    EXPECT_TRUE(listener.resolved[0].manual_entry);
}

TEST_F(ScanSessionTest, BlankManualEntryIsRejected) {
    ScanOutcome outcome = session->submitManualEntry("   ");

    EXPECT_EQ(SCAN_NO_IDENTIFIER_FOUND, outcome.status);
    ASSERT_EQ(1u, listener.failures.size());
    EXPECT_TRUE(listener.resolved.empty());
}

TEST_F(ScanSessionTest, UploadNeedsUploadMode) {
    cv::Mat image(60, 80, CV_8UC3, cv::Scalar(0, 0, 0));
    EXPECT_THROW(session->processUpload(image), std::logic_error);
}

TEST_F(ScanSessionTest, UploadRunsPipelineOnce) {
    ASSERT_TRUE(session->switchToUploadMode());
    barcode->enqueue({makePayload("IMEI1: 354626223546262")});

    ScanOutcome outcome = session->processUpload(cv::Mat(60, 80, CV_8UC3, cv::Scalar(0, 0, 0)));

    EXPECT_EQ(SCAN_SUCCESS, outcome.status);
    EXPECT_EQ("354626223546262", outcome.identifier);
    EXPECT_EQ(CandidateOrigin::Labeled, outcome.origin);
    ASSERT_EQ(1u, listener.resolved.size());
    EXPECT_EQ(0, stats().open_attempts);
    EXPECT_EQ(0, executor->submitted);
}

TEST_F(ScanSessionTest, UploadOfUnreadableImage) {
    ASSERT_TRUE(session->switchToUploadMode());

    EXPECT_EQ(SCAN_INVALID_IMAGE, session->processUpload(cv::Mat()).status);
    EXPECT_EQ(SCAN_INVALID_IMAGE, session->processUploadFile("/nonexistent/label.png").status);
    EXPECT_EQ(2u, listener.failures.size());
    EXPECT_EQ(SCAN_INVALID_IMAGE, session->lastError());
}

TEST_F(ScanSessionTest, DestructionReleasesCamera) {
    startActive();
    loop.advance(milliseconds(2000));

    session.reset();

    EXPECT_EQ(0, stats().open_handles);
    EXPECT_EQ(0u, loop.pendingCount());
    executor->runNext();
    loop.advance(milliseconds(60000));
    EXPECT_TRUE(listener.resolved.empty());
}

TEST(ScanSession, RequiresCollaborators) {
    EventLoop loop;
    auto settings = createScannerSettings();
    EXPECT_THROW(ScanSession(settings, nullptr, nullptr, nullptr, loop, nullptr), std::runtime_error);
}

TEST(CameraFailure, MapsToScanStatus) {
    EXPECT_EQ(SCAN_PERMISSION_DENIED, classifyCameraFailure(CameraFailure::PermissionDenied));
    EXPECT_EQ(SCAN_DEVICE_NOT_FOUND, classifyCameraFailure(CameraFailure::DeviceNotFound));
    EXPECT_EQ(SCAN_DEVICE_BUSY, classifyCameraFailure(CameraFailure::DeviceBusy));
    EXPECT_EQ(SCAN_UNSUPPORTED_CONSTRAINTS, classifyCameraFailure(CameraFailure::UnsupportedConstraints));

    CameraError error(CameraFailure::DeviceBusy, "in use");
    EXPECT_EQ(CameraFailure::DeviceBusy, error.failure());
    EXPECT_STREQ("in use", error.what());
}

TEST(OpenCvCameraDevice, OpenOfMissingCameraThrowsDeviceNotFound) {
    OpenCvCameraDevice device(4);
    CameraConstraints constraints = {0, 0, 0, 0, 0.0};

    try {
        device.open("63", constraints);
        FAIL() << "expected CameraError";
    } catch (const CameraError& e) {
        EXPECT_EQ(CameraFailure::DeviceNotFound, e.failure());
    }

    try {
        device.open("front", constraints);
        FAIL() << "expected CameraError";
    } catch (const CameraError& e) {
        EXPECT_EQ(CameraFailure::DeviceNotFound, e.failure());
    }
}
