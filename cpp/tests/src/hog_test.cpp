#include <gtest/gtest.h>

#include <stdexcept>

#include <kridge>

using namespace kridge;

namespace {

// one channel image, value depends on the edge orientation requested
VectorXd step_image(const ImageShape& shape, bool vertical_edge) {
    VectorXd image(shape.size());
    for (int r = 0; r < shape.height; r++) {
        for (int col = 0; col < shape.width; col++) {
            const bool bright = vertical_edge ? col >= shape.width / 2 : r >= shape.height / 2;
            image(shape.offset(0, r, col)) = bright ? 1.0 : 0.0;
        }
    }
    return image;
}

}

TEST(HogTest, FeatureWidth) {
    HogExtractor hog;
    // 4x4 cells, 3x3 blocks of 2x2 cells, 9 bins
    EXPECT_EQ(hog.n_features(), 324);
    const MatrixXd features = hog.transform(MatrixXd::Random(2, 32 * 32 * 3));
    EXPECT_EQ(features.rows(), 2);
    EXPECT_EQ(features.cols(), 324);

    HogExtractor small(ImageShape(16, 16, 1), 8, 9, 2);
    EXPECT_EQ(small.n_features(), 36);
}

TEST(HogTest, FlatImageHasNoGradient) {
    HogExtractor hog(ImageShape(16, 16, 1), 8, 9, 2);
    const VectorXd features = hog.transform_one(VectorXd::Constant(256, 0.7));
    EXPECT_EQ(features.size(), 36);
    EXPECT_DOUBLE_EQ(features.cwiseAbs().maxCoeff(), 0.0);
}

TEST(HogTest, VerticalEdgeVotesIntoHorizontalOrientationBins) {
    const ImageShape shape(16, 16, 1);
    HogExtractor hog(shape, 8, 9, 2);
    const VectorXd features = hog.transform_one(step_image(shape, true));
    // gradient along x: orientation 0, split between the first and last bin
    double mass = 0.0;
    for (Index k = 0; k < features.size(); k++) {
        const Index bin = k % 9;
        if (bin != 0 && bin != 8) {
            EXPECT_DOUBLE_EQ(features(k), 0.0) << "bin " << bin;
        }
        mass += features(k);
    }
    EXPECT_GT(mass, 0.0);
}

TEST(HogTest, HorizontalEdgeVotesIntoMiddleBin) {
    const ImageShape shape(16, 16, 1);
    HogExtractor hog(shape, 8, 9, 2);
    const VectorXd features = hog.transform_one(step_image(shape, false));
    // gradient along y: orientation 90 sits on the centre of bin 4
    double mass = 0.0;
    for (Index k = 0; k < features.size(); k++) {
        if (k % 9 != 4) {
            EXPECT_DOUBLE_EQ(features(k), 0.0) << "feature " << k;
        }
        mass += features(k);
    }
    EXPECT_GT(mass, 0.0);
}

TEST(HogTest, BlocksAreNormalized) {
    HogExtractor hog(ImageShape(16, 16, 3), 8, 9, 2);
    MatrixXd images = MatrixXd::Random(1, 16 * 16 * 3);
    const VectorXd features = hog.transform(images).row(0).transpose();
    EXPECT_NEAR(features.norm(), 1.0, 1e-6);
    EXPECT_LE(features.maxCoeff(), 1.0);
    EXPECT_GE(features.minCoeff(), 0.0);
}

TEST(HogTest, RowsAreTransformedIndependently) {
    const ImageShape shape(16, 16, 1);
    HogExtractor hog(shape, 8, 9, 2);
    MatrixXd images(2, shape.size());
    images.row(0) = step_image(shape, true).transpose();
    images.row(1) = step_image(shape, false).transpose();
    const MatrixXd features = hog.transform(images);
    EXPECT_TRUE(features.row(0).transpose().isApprox(hog.transform_one(images.row(0).transpose())));
    EXPECT_TRUE(features.row(1).transpose().isApprox(hog.transform_one(images.row(1).transpose())));
    EXPECT_TRUE(features == hog.transform(images));
}

TEST(HogTest, RejectsBadShapes) {
    HogExtractor hog(ImageShape(16, 16, 1), 8, 9, 2);
    EXPECT_THROW(hog.transform(MatrixXd::Zero(1, 100)), ShapeMismatchError);
    EXPECT_THROW(hog.transform_one(VectorXd::Zero(100)), ShapeMismatchError);
    EXPECT_THROW(HogExtractor(ImageShape(8, 8, 1), 8, 9, 2), std::invalid_argument);
    EXPECT_THROW(HogExtractor(ImageShape(0, 8, 1)), std::invalid_argument);
    EXPECT_THROW(HogExtractor(ImageShape(), 8, 0, 2), std::invalid_argument);
}
