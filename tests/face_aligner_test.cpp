// tests/face_aligner_test.cpp
#include <QImage>
#include <QPointF>
#include <QTransform>
#include "FaceAligner.hpp"
#include "gtest/gtest.h"

static FaceDetection faceWithEyes(float lx, float ly, float rx, float ry)
{
    FaceDetection face{};
    face.x1 = 40.0f;
    face.y1 = 20.0f;
    face.x2 = 200.0f;
    face.y2 = 200.0f;
    face.confidence = 0.9f;
    face.left_eye_x = lx;
    face.left_eye_y = ly;
    face.right_eye_x = rx;
    face.right_eye_y = ry;
    return face;
}

TEST(FaceAlignerTransform, LevelEyesLandOnCanonicalPositions) {
    QTransform tf;
    ASSERT_TRUE(FaceAligner::alignmentTransform(faceWithEyes(100, 90, 204, 90), tf));

    QPointF left = tf.map(QPointF(100, 90));
    QPointF right = tf.map(QPointF(204, 90));
    EXPECT_NEAR(left.x(), FaceAligner::kLeftEyeX, 1e-6);
    EXPECT_NEAR(left.y(), FaceAligner::kEyeY, 1e-6);
    EXPECT_NEAR(right.x(), FaceAligner::kRightEyeX, 1e-6);
    EXPECT_NEAR(right.y(), FaceAligner::kEyeY, 1e-6);
}

TEST(FaceAlignerTransform, TiltedEyesAreLeveled) {
    QTransform tf;
    ASSERT_TRUE(FaceAligner::alignmentTransform(faceWithEyes(80, 100, 110, 140), tf));

    QPointF left = tf.map(QPointF(80, 100));
    QPointF right = tf.map(QPointF(110, 140));
    EXPECT_NEAR(left.x(), FaceAligner::kLeftEyeX, 1e-6);
    EXPECT_NEAR(left.y(), FaceAligner::kEyeY, 1e-6);
    EXPECT_NEAR(right.x(), FaceAligner::kRightEyeX, 1e-6);
    EXPECT_NEAR(right.y(), FaceAligner::kEyeY, 1e-6);
}

TEST(FaceAlignerTransform, CoincidentEyesHaveNoTransform) {
    QTransform tf;
    EXPECT_FALSE(FaceAligner::alignmentTransform(faceWithEyes(100, 100, 100, 100), tf));
}

TEST(FaceAlignerImage, AlignedFaceIsArcFaceSized) {
    QImage frame(320, 240, QImage::Format_RGB888);
    frame.fill(Qt::white);

    QImage aligned = FaceAligner::alignFace(frame, faceWithEyes(100, 90, 150, 92));
    EXPECT_EQ(aligned.width(), FaceAligner::kAlignedSize);
    EXPECT_EQ(aligned.height(), FaceAligner::kAlignedSize);

    // Degenerate eyes fall back to the box crop
    QImage cropped = FaceAligner::alignFace(frame, faceWithEyes(100, 100, 100, 100));
    EXPECT_EQ(cropped.size(), QSize(FaceAligner::kAlignedSize, FaceAligner::kAlignedSize));
}

TEST(FaceAlignerImage, CropIsClampedToFrame) {
    QImage frame(320, 240, QImage::Format_RGB888);
    frame.fill(Qt::white);

    FaceDetection overhanging = faceWithEyes(0, 0, 0, 0);
    overhanging.x1 = 250.0f;
    overhanging.y1 = 180.0f;
    overhanging.x2 = 400.0f;
    overhanging.y2 = 300.0f;
    QImage crop = FaceAligner::cropFace(frame, overhanging);
    EXPECT_EQ(crop.size(), QSize(FaceAligner::kAlignedSize, FaceAligner::kAlignedSize));

    FaceDetection empty = faceWithEyes(0, 0, 0, 0);
    empty.x1 = 50.0f;
    empty.x2 = 50.0f;
    EXPECT_TRUE(FaceAligner::cropFace(frame, empty).isNull());
}
