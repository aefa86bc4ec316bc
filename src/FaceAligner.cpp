// FaceAligner.cpp
#include "FaceAligner.hpp"
#include <QPainter>
#include <algorithm>
#include <cmath>

namespace FaceAligner {

bool alignmentTransform(const FaceDetection& face, QTransform& out)
{
    double dx = face.right_eye_x - face.left_eye_x;
    double dy = face.right_eye_y - face.left_eye_y;
    double dist_src = std::sqrt(dx * dx + dy * dy);
    if (dist_src < 1e-6) {
        return false;
    }
    double scale = (kRightEyeX - kLeftEyeX) / dist_src;
    double angle_src = std::atan2(dy, dx);

    // QTransform applies these to points in reverse order:
    // left eye to origin, scale, level the eye line, move to the target left eye
    QTransform tf;
    tf.translate(kLeftEyeX, kEyeY);
    tf.rotateRadians(-angle_src);
    tf.scale(scale, scale);
    tf.translate(-face.left_eye_x, -face.left_eye_y);
    out = tf;
    return true;
}

QImage alignFace(const QImage& frame, const FaceDetection& face)
{
    QTransform tf;
    if (!alignmentTransform(face, tf)) {
        return cropFace(frame, face);
    }

    QImage aligned(kAlignedSize, kAlignedSize, QImage::Format_RGB888);
    aligned.fill(Qt::black);

    QPainter painter(&aligned);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);
    painter.setTransform(tf);
    painter.drawImage(QPoint(0, 0), frame);
    painter.end();

    return aligned;
}

QImage cropFace(const QImage& frame, const FaceDetection& face)
{
    int x = std::clamp(static_cast<int>(face.x1), 0, std::max(0, frame.width() - 1));
    int y = std::clamp(static_cast<int>(face.y1), 0, std::max(0, frame.height() - 1));
    int w = std::min(frame.width() - x, static_cast<int>(face.x2 - face.x1));
    int h = std::min(frame.height() - y, static_cast<int>(face.y2 - face.y1));
    if (w <= 0 || h <= 0) {
        return QImage();
    }
    return frame.copy(x, y, w, h).scaled(kAlignedSize, kAlignedSize);
}

} // namespace FaceAligner
