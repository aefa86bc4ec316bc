//include/FaceDetector.hpp
#pragma once

#include <QImage>
#include <vector>
#include <string>
#include <onnxruntime_cxx_api.h>
#include <memory>

// One detected face in frame pixel coordinates, with the six BlazeFace landmarks
struct FaceDetection {
    float x1, y1, x2, y2;
    float confidence;
    float left_eye_x, left_eye_y;
    float right_eye_x, right_eye_y;
    float nose_x, nose_y;
    float mouth_x, mouth_y;
    float left_cheek_x, left_cheek_y;
    float right_cheek_x, right_cheek_y;
};

// Runs a BlazeFace ONNX model that takes the thresholds as extra inputs
class FaceDetector {
public:
    FaceDetector(const std::string& model_path,
                 int maxDetections,
                 float confThresh,
                 float iouThresh);

    std::vector<FaceDetection> detect(const QImage& img);

private:
    Ort::Env env;
    Ort::SessionOptions session_options;
    std::unique_ptr<Ort::Session> session;

    int maxDetections;
    float confThresh;
    float iouThresh;

    static constexpr int kInputSize = 128;
    static constexpr float kMinBoxSide = 5.0f;
};

// Opens an ONNX session, converting the path the way the platform's ORT build expects
std::unique_ptr<Ort::Session> openOnnxSession(Ort::Env& env,
                                              const Ort::SessionOptions& options,
                                              const std::string& model_path);
