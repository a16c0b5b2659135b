#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include <kridge>

using namespace kridge;

TEST(LabelBinarizerTest, ColumnsFollowSortedClasses) {
    VectorXi y(4);
    y << 3, 1, 3, 7;
    LabelBinarizer binarizer;
    const MatrixXd Y = binarizer.fit_transform(y);

    const std::vector<int> expected = {1, 3, 7};
    EXPECT_EQ(binarizer.classes(), expected);
    ASSERT_EQ(Y.rows(), 4);
    ASSERT_EQ(Y.cols(), 3);

    MatrixXd want(4, 3);
    want << -1, 1, -1,
             1, -1, -1,
            -1, 1, -1,
            -1, -1, 1;
    EXPECT_EQ(Y, want);
}

TEST(LabelBinarizerTest, TwoClassesKeepTwoColumns) {
    VectorXi y(3);
    y << 0, 1, 1;
    LabelBinarizer binarizer;
    const MatrixXd Y = binarizer.fit_transform(y);
    ASSERT_EQ(Y.cols(), 2);
    EXPECT_TRUE(Y.col(0) == -Y.col(1));
}

TEST(LabelBinarizerTest, CustomPositiveAndNegativeValues) {
    VectorXi y(2);
    y << 4, 2;
    LabelBinarizer binarizer(1.0, 0.0);
    const MatrixXd Y = binarizer.fit_transform(y);
    EXPECT_DOUBLE_EQ(Y(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(Y(0, 1), 1.0);
    EXPECT_THROW(LabelBinarizer(1.0, 1.0), std::invalid_argument);
}

TEST(LabelBinarizerTest, InverseTransformMapsRanksToLabels) {
    VectorXi y(3);
    y << -5, 10, 2;
    LabelBinarizer binarizer;
    binarizer.fit(y);
    VectorXi idx(4);
    idx << 2, 0, 1, 0;
    VectorXi want(4);
    want << 10, -5, 2, -5;
    EXPECT_EQ(binarizer.inverse_transform(idx), want);
    EXPECT_EQ(binarizer.index_of(2), 1);

    VectorXi bad(1);
    bad << 3;
    EXPECT_THROW(binarizer.inverse_transform(bad), std::invalid_argument);
}

TEST(LabelBinarizerTest, UnseenLabelsAndUnfittedUseFail) {
    LabelBinarizer binarizer;
    VectorXi y(2);
    y << 0, 1;
    EXPECT_THROW(binarizer.transform(y), NotFittedError);
    EXPECT_THROW(binarizer.fit(VectorXi()), ShapeMismatchError);

    binarizer.fit(y);
    VectorXi unseen(1);
    unseen << 5;
    EXPECT_THROW(binarizer.transform(unseen), std::invalid_argument);
}
