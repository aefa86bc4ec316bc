#include "FaceDetector.hpp"
#include <QImage>
#include <QColor>
#include <array>
#include <vector>
#include <onnxruntime_cxx_api.h>
#include <stdexcept>  // For std::runtime_error
#include <filesystem> // For checking if model file exists
#include <QDebug>

std::unique_ptr<Ort::Session> openOnnxSession(Ort::Env& env,
                                              const Ort::SessionOptions& options,
                                              const std::string& model_path)
{
    // Verify the model file exists (avoid silent fails)
    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("Model file not found: " + model_path);
    }
#ifdef _WIN32
    // Windows ONNX Runtime API expects wide string paths
    std::wstring wide_model_path(model_path.begin(), model_path.end());
    return std::make_unique<Ort::Session>(env, wide_model_path.c_str(), options);
#else
    return std::make_unique<Ort::Session>(env, model_path.c_str(), options);
#endif
}

FaceDetector::FaceDetector(const std::string& model_path,
                           int maxDetections_,
                           float confThresh_,
                           float iouThresh_)
    : env(ORT_LOGGING_LEVEL_WARNING, "face_detector"),
      maxDetections(maxDetections_),
      confThresh(confThresh_),
      iouThresh(iouThresh_)
{
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    session = openOnnxSession(env, session_options, model_path);
}

std::vector<FaceDetection> FaceDetector::detect(const QImage& img) {
    std::vector<FaceDetection> results;
    if (img.isNull())
        return results;

    // 1. RGB888 at model resolution, written straight into NCHW planes normalized to [0, 1]
    QImage rgb = img.convertToFormat(QImage::Format_RGB888).scaled(kInputSize, kInputSize);
    const int plane = kInputSize * kInputSize;
    std::vector<float> chw(3 * plane);
    for (int y = 0; y < kInputSize; ++y) {
        for (int x = 0; x < kInputSize; ++x) {
            QColor color = rgb.pixelColor(x, y);
            int idx = y * kInputSize + x;
            chw[0 * plane + idx] = color.red() / 255.0f;
            chw[1 * plane + idx] = color.green() / 255.0f;
            chw[2 * plane + idx] = color.blue() / 255.0f;
        }
    }

    // 2. Four inputs: image, confidence threshold, max detections, IOU threshold
    Ort::AllocatorWithDefaultOptions allocator;
    std::array<Ort::AllocatedStringPtr, 4> input_name_ptrs = {
        session->GetInputNameAllocated(0, allocator),
        session->GetInputNameAllocated(1, allocator),
        session->GetInputNameAllocated(2, allocator),
        session->GetInputNameAllocated(3, allocator)
    };
    std::array<const char*, 4> input_names = {
        input_name_ptrs[0].get(), input_name_ptrs[1].get(),
        input_name_ptrs[2].get(), input_name_ptrs[3].get()
    };

    std::array<int64_t, 4> input_shape = {1, 3, kInputSize, kInputSize};
    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    float conf_thresh = confThresh;
    int64_t max_detections = maxDetections;
    float iou_thresh = iouThresh;

    std::array<int64_t, 1> single_dim = {1};
    std::array<Ort::Value, 4> input_tensors = {
        Ort::Value::CreateTensor<float>(memory_info, chw.data(), chw.size(), input_shape.data(), input_shape.size()),
        Ort::Value::CreateTensor<float>(memory_info, &conf_thresh, 1, single_dim.data(), 1),
        Ort::Value::CreateTensor<int64_t>(memory_info, &max_detections, 1, single_dim.data(), 1),
        Ort::Value::CreateTensor<float>(memory_info, &iou_thresh, 1, single_dim.data(), 1)
    };

    std::vector<std::string> output_names_str = session->GetOutputNames();
    std::vector<const char*> output_names;
    for (const auto& name : output_names_str)
        output_names.push_back(name.c_str());

    auto output_tensors = session->Run(
        Ort::RunOptions{nullptr},
        input_names.data(),
        input_tensors.data(),
        input_tensors.size(),
        output_names.data(),
        output_names.size()
    );

    // 3. Boxes are [N, 16]: y1 x1 y2 x2 followed by six (x, y) landmarks, all normalized
    const float* boxes_data = output_tensors[0].GetTensorData<float>();
    const float* scores_data = (output_tensors.size() > 1) ? output_tensors[1].GetTensorData<float>() : nullptr;

    size_t num_boxes = output_tensors[0].GetTensorTypeAndShapeInfo().GetElementCount() / 16;

    const float w = static_cast<float>(img.width());
    const float h = static_cast<float>(img.height());

    for (size_t i = 0; i < num_boxes; ++i) {
        const float* det = boxes_data + i * 16;

        FaceDetection fd;
        fd.y1 = det[0] * h;
        fd.x1 = det[1] * w;
        fd.y2 = det[2] * h;
        fd.x2 = det[3] * w;
        if (fd.x2 - fd.x1 < kMinBoxSide || fd.y2 - fd.y1 < kMinBoxSide)
            continue;

        fd.confidence = scores_data ? scores_data[i] : 1.0f;
        fd.left_eye_x = det[4] * w;
        fd.left_eye_y = det[5] * h;
        fd.right_eye_x = det[6] * w;
        fd.right_eye_y = det[7] * h;
        fd.nose_x = det[8] * w;
        fd.nose_y = det[9] * h;
        fd.mouth_x = det[10] * w;
        fd.mouth_y = det[11] * h;
        fd.left_cheek_x = det[12] * w;
        fd.left_cheek_y = det[13] * h;
        fd.right_cheek_x = det[14] * w;
        fd.right_cheek_y = det[15] * h;

        qDebug() << "Face" << i << "box:" << fd.x1 << fd.y1 << fd.x2 << fd.y2 << "conf:" << fd.confidence;

        results.push_back(fd);
    }

    return results;
}
