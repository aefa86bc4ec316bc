// FaceAligner.hpp
#pragma once

#include <QImage>
#include <QTransform>
#include "FaceDetector.hpp"

namespace FaceAligner {

// ArcFace canvas and the eye positions it expects
constexpr int kAlignedSize = 112;
constexpr double kLeftEyeX = 30.0;
constexpr double kRightEyeX = 82.0;
constexpr double kEyeY = 48.0;

// Similarity transform taking the detected eyes onto the canonical eye positions.
// Returns false when the eyes are too close together to define one.
bool alignmentTransform(const FaceDetection& face, QTransform& out);

// Warps the frame so the eyes land on the canonical positions; falls back to cropFace()
QImage alignFace(const QImage& frame, const FaceDetection& face);

// Box crop clamped to the frame, scaled to the ArcFace input size
QImage cropFace(const QImage& frame, const FaceDetection& face);

} // namespace FaceAligner
