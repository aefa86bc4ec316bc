// FaceEmbedder.hpp
#pragma once

#include <vector>
#include <string>
#include <memory>
#include <onnxruntime_cxx_api.h>
#include <QImage>

// Extracts ArcFace embeddings from aligned 112x112 face crops
class FaceEmbedder {
public:
    explicit FaceEmbedder(const std::string& modelPath);

    // Given an aligned face, returns a unit-length embedding of dimension()
    std::vector<float> getEmbedding(const QImage& face);

    int dimension() const { return dim; }

private:
    Ort::Env env;
    Ort::SessionOptions sessionOpts;
    std::unique_ptr<Ort::Session> session;
    int dim = 512;

    // NHWC [1, 112, 112, 3] float32, (v - 127.5) / 128
    std::vector<float> preprocess(const QImage& img);
};
