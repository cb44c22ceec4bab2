#include "text_recognizer.h"

#include <iostream>
#include <stdexcept>

TesseractTextCapability::TesseractTextCapability(const std::string& data_path, const std::string& language)
    : api(new tesseract::TessBaseAPI()) {

    const char* path = data_path.empty() ? nullptr : data_path.c_str();
    if (api->Init(path, language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
        throw std::runtime_error("Could not initialize tesseract with language '" + language + "'");
    }
    api->SetPageSegMode(tesseract::PSM_AUTO);

    std::cout << "Text recognizer created (tesseract " << tesseract::TessBaseAPI::Version()
              << ", language " << language << ")" << std::endl;
}

TesseractTextCapability::~TesseractTextCapability() {
    api->End();
}

std::string TesseractTextCapability::name() const {
    return "tesseract OCR";
}

std::vector<DecodedPayload> TesseractTextCapability::decode(const cv::Mat& gray_image) {
    std::vector<DecodedPayload> results;

    api->SetImage(gray_image.data, gray_image.cols, gray_image.rows, 1, static_cast<int>(gray_image.step));
    std::unique_ptr<char[]> text(api->GetUTF8Text());
    api->Clear();

    if (!text) {
        throw std::runtime_error("tesseract returned no text buffer");
    }

    DecodedPayload payload;
    payload.text = text.get();
    payload.source_method = SourceMethod::OCR;
    payload.format_name = "tesseract";

    if (payload.text.find_first_not_of(" \t\r\n") != std::string::npos) {
        std::cout << "OCR recognized " << payload.text.length() << " character(s)" << std::endl;
        results.push_back(payload);
    }
    return results;
}
