// FaceAnalyzer.cpp
#include "FaceAnalyzer.hpp"
#include "FaceAligner.hpp"

std::vector<AnalyzedFace> FaceAnalyzer::analyze(const QImage& frame)
{
    std::vector<AnalyzedFace> out;
    for (const auto& face : detect(frame)) {
        std::vector<float> emb = embed(frame, face);
        if (emb.empty()) continue; // alignment produced nothing usable
        out.push_back({face, std::move(emb)});
    }
    return out;
}

OnnxFaceAnalyzer::OnnxFaceAnalyzer(const std::string& detectorModelPath,
                                   const std::string& embedderModelPath,
                                   int maxDetections,
                                   float confThresh,
                                   float iouThresh)
    : detector(std::make_unique<FaceDetector>(detectorModelPath, maxDetections, confThresh, iouThresh)),
      embedder(std::make_unique<FaceEmbedder>(embedderModelPath))
{
}

std::vector<FaceDetection> OnnxFaceAnalyzer::detect(const QImage& frame)
{
    return detector->detect(frame);
}

std::vector<float> OnnxFaceAnalyzer::embed(const QImage& frame, const FaceDetection& face)
{
    QImage aligned = FaceAligner::alignFace(frame, face);
    if (aligned.isNull()) {
        return {};
    }
    return embedder->getEmbedding(aligned);
}

int OnnxFaceAnalyzer::embeddingDimension() const
{
    return embedder->dimension();
}
