// FaceEmbedder.cpp

#include "FaceEmbedder.hpp"
#include "FaceDetector.hpp" // openOnnxSession
#include "FaceGallery.hpp"  // normalize
#include <QColor>
#include <array>
#include <stdexcept>

static constexpr int kFaceSize = 112;

FaceEmbedder::FaceEmbedder(const std::string& modelPath)
    : env(ORT_LOGGING_LEVEL_WARNING, "arcface_embedder")
{
    sessionOpts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    session = openOnnxSession(env, sessionOpts, modelPath);

    // Output is [1, D]; dynamic widths are reported as -1, keep the ArcFace default then
    auto shape = session->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (!shape.empty() && shape.back() > 0) {
        dim = static_cast<int>(shape.back());
    }
}

std::vector<float> FaceEmbedder::preprocess(const QImage& img)
{
    QImage rgb = img.convertToFormat(QImage::Format_RGB888).scaled(kFaceSize, kFaceSize);

    std::vector<float> data(kFaceSize * kFaceSize * 3);
    for (int y = 0; y < kFaceSize; ++y) {
        for (int x = 0; x < kFaceSize; ++x) {
            QColor c = rgb.pixelColor(x, y);
            int idx = (y * kFaceSize + x) * 3;
            data[idx + 0] = (c.red()   - 127.5f) / 128.0f;
            data[idx + 1] = (c.green() - 127.5f) / 128.0f;
            data[idx + 2] = (c.blue()  - 127.5f) / 128.0f;
        }
    }
    return data;
}

std::vector<float> FaceEmbedder::getEmbedding(const QImage& face)
{
    std::vector<float> input = preprocess(face);
    std::array<int64_t, 4> inputShape = {1, kFaceSize, kFaceSize, 3};

    Ort::MemoryInfo memInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    Ort::Value inputTensor = Ort::Value::CreateTensor<float>(
        memInfo, input.data(), input.size(), inputShape.data(), inputShape.size()
    );

    Ort::AllocatorWithDefaultOptions allocator;
    auto inputName = session->GetInputNameAllocated(0, allocator);
    auto outputName = session->GetOutputNameAllocated(0, allocator);
    std::array<const char*, 1> inputNames = {inputName.get()};
    std::array<const char*, 1> outputNames = {outputName.get()};

    auto outputTensors = session->Run(
        Ort::RunOptions{nullptr},
        inputNames.data(), &inputTensor, 1,
        outputNames.data(), 1
    );

    size_t count = outputTensors[0].GetTensorTypeAndShapeInfo().GetElementCount();
    if (count < static_cast<size_t>(dim)) {
        throw std::runtime_error("Embedding model returned " + std::to_string(count) +
                                 " values, expected " + std::to_string(dim));
    }
    const float* outputData = outputTensors[0].GetTensorData<float>();
    std::vector<float> embedding(outputData, outputData + dim);

    // Unit length, so L2 distance and cosine similarity are interchangeable
    FaceGallery::normalize(embedding);
    return embedding;
}
