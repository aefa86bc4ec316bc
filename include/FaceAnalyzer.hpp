// FaceAnalyzer.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include <QImage>
#include "FaceDetector.hpp"
#include "FaceEmbedder.hpp"

struct AnalyzedFace {
    FaceDetection detection;
    std::vector<float> embedding;
};

// Detection + embedding front end. Everything downstream only needs this interface.
class FaceAnalyzer {
public:
    virtual ~FaceAnalyzer() = default;

    virtual std::vector<FaceDetection> detect(const QImage& frame) = 0;
    virtual std::vector<float> embed(const QImage& frame, const FaceDetection& face) = 0;
    virtual int embeddingDimension() const = 0;

    // Detects every face in the frame and embeds each one
    std::vector<AnalyzedFace> analyze(const QImage& frame);
};

// BlazeFace detector -> eye alignment -> ArcFace embedder
class OnnxFaceAnalyzer : public FaceAnalyzer {
public:
    OnnxFaceAnalyzer(const std::string& detectorModelPath,
                     const std::string& embedderModelPath,
                     int maxDetections,
                     float confThresh,
                     float iouThresh);

    std::vector<FaceDetection> detect(const QImage& frame) override;
    std::vector<float> embed(const QImage& frame, const FaceDetection& face) override;
    int embeddingDimension() const override;

private:
    std::unique_ptr<FaceDetector> detector;
    std::unique_ptr<FaceEmbedder> embedder;
};
