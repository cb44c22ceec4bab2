// Command-line front end for the IMEI scanner
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <opencv2/opencv.hpp>

#include "camera_device.h"
#include "detection_pipeline.h"
#include "event_loop.h"
#include "pipeline_executor.h"
#include "scan_session.h"
#include "scanner_settings.h"

namespace {

volatile std::sig_atomic_t interrupted = 0;

void handleInterrupt(int) {
    interrupted = 1;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <image_path>" << std::endl;
    std::cout << "       " << program << " [options] --camera [camera_index]" << std::endl;
    std::cout << "       " << program << " --manual <text>" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --no-ocr           skip text recognition stages" << std::endl;
    std::cout << "  --tessdata <dir>   tesseract language data directory" << std::endl;
    std::cout << "  --lang <code>      tesseract language (default eng)" << std::endl;
    std::cout << "  --timeout <ms>     live scan timeout (default 30000)" << std::endl;
}

// Prints results and stops the loop once the session has an answer.
class ConsoleListener : public ScanSessionListener {
public:
    explicit ConsoleListener(EventLoop& event_loop) : loop(event_loop), resolved(false), finished(false) {}

    void onIdentifierResolved(const ScanOutcome& outcome) override {
        std::cout << "\n=== SCAN RESULT ===" << std::endl;
        std::cout << "Identifier: " << outcome.identifier << std::endl;
        std::cout << "Status: " << getScanStatusName(outcome.status) << std::endl;
        if (outcome.manual_entry) {
            std::cout << "Source: manual entry" << std::endl;
        } else {
            std::cout << "Kind: " << getCandidateKindName(outcome.kind) << std::endl;
            std::cout << "Origin: " << getCandidateOriginName(outcome.origin) << std::endl;
            std::cout << "Source: " << getSourceMethodName(outcome.source_method) << std::endl;
            std::cout << "Stage: " << getPipelineStageName(outcome.stage) << std::endl;
        }
        if (outcome.status == SCAN_VALIDATION_FAILED) {
            std::cout << "Warning: IMEI checksum did not verify, please double-check" << std::endl;
        }
        resolved = true;
        finish();
    }

    void onScanFailed(ScanStatus status, const std::string& message) override {
        std::cout << "\n=== SCAN RESULT ===" << std::endl;
        std::cout << "No identifier: " << message << " (" << getScanStatusName(status) << ")" << std::endl;
        finish();
    }

    bool isResolved() const { return resolved; }
    bool isFinished() const { return finished; }

private:
    void finish() {
        finished = true;
        loop.stop();
    }

    EventLoop& loop;
    bool resolved;
    bool finished;
};

void pollInterrupt(EventLoop& loop, ScanSession& session, ConsoleListener& listener) {
    if (interrupted) {
        std::cout << "\nInterrupted, stopping camera" << std::endl;
        session.emergencyStop();
        loop.stop();
        return;
    }
    if (listener.isFinished()) return;

    loop.schedule(std::chrono::milliseconds(100), [&loop, &session, &listener]() {
        pollInterrupt(loop, session, listener);
    });
}

} // namespace

int main(int argc, char* argv[]) {
    std::string image_path;
    std::string manual_text;
    std::string camera_index;
    bool camera_mode = false;
    bool manual_mode = false;

    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--camera") camera_mode = true;
    }

    auto settings = createScannerSettings(camera_mode ? PRESET_REALTIME_MODE : PRESET_UPLOAD_MODE);
    configureScannerForPhonePackaging(settings);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--camera") {
            camera_mode = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') camera_index = argv[++i];
        } else if (arg == "--manual" && i + 1 < argc) {
            manual_mode = true;
            manual_text = argv[++i];
        } else if (arg == "--no-ocr") {
            settings->setOcrEnabled(false);
        } else if (arg == "--tessdata" && i + 1 < argc) {
            settings->setOcrDataPath(argv[++i]);
        } else if (arg == "--lang" && i + 1 < argc) {
            settings->setOcrLanguage(argv[++i]);
        } else if (arg == "--timeout" && i + 1 < argc) {
            settings->setScanTimeoutMs(std::atoi(argv[++i]));
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && image_path.empty()) {
            image_path = arg;
        } else {
            std::cout << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!camera_mode && !manual_mode && image_path.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::cout << "=== IMEI SCANNER ===" << std::endl;
    std::cout << "ZXing + zbar + libdmtx barcode decoding, tesseract OCR" << std::endl;

    try {
        if (camera_mode && !camera_index.empty()) {
            settings->setPreferredCameraId(camera_index);
        }

        // Manual entry never runs the decoders, so skip loading tesseract
        if (manual_mode) {
            settings->setOcrEnabled(false);
        }
        auto pipeline = createDetectionPipeline(settings);

        EventLoop loop;
        auto executor = std::make_shared<LoopPipelineExecutor>(loop);
        auto camera_device = std::make_shared<OpenCvCameraDevice>(settings->getCameraProbeCount());
        ConsoleListener listener(loop);
        ScanSession session(settings, camera_device, pipeline, executor, loop, &listener);

        if (manual_mode) {
            session.submitManualEntry(manual_text);
            return listener.isResolved() ? 0 : 1;
        }

        if (!camera_mode) {
            std::cout << "Processing: " << image_path << std::endl;
            session.switchToUploadMode();
            ScanOutcome outcome = session.processUploadFile(image_path);
            return (outcome.status == SCAN_SUCCESS || outcome.status == SCAN_VALIDATION_FAILED) ? 0 : 1;
        }

        std::signal(SIGINT, handleInterrupt);
        std::cout << "Scanning from camera, press Ctrl-C to stop" << std::endl;
        if (!session.startCamera()) {
            std::cout << "Could not start the camera" << std::endl;
            return 1;
        }
        pollInterrupt(loop, session, listener);
        loop.run();

        if (session.state() == SessionState::EmergencyStopped) {
            session.acknowledgeEmergencyStop();
        }
        return listener.isResolved() ? 0 : 1;

    } catch (const std::exception& e) {
        std::cout << "Error: " << e.what() << std::endl;
        return 1;
    }
}
