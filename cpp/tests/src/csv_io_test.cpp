#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include <kridge>

using namespace kridge;

class CsvIoTest : public ::testing::Test {
protected:
    std::string path;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path = ::testing::TempDir() + "kridge_" + info->name() + ".csv";
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    void write(const std::string& text) {
        std::ofstream out(path);
        out << text;
    }
};

TEST_F(CsvIoTest, LoadsMatrix) {
    write("1,2.5,-3\n4,5,6e-1\n");
    const MatrixXd x = load_matrix(path);
    ASSERT_EQ(x.rows(), 2);
    ASSERT_EQ(x.cols(), 3);
    EXPECT_DOUBLE_EQ(x(0, 1), 2.5);
    EXPECT_DOUBLE_EQ(x(1, 2), 0.6);
}

TEST_F(CsvIoTest, SkipsHeaderAndCarriageReturns) {
    write("a,b\r\n1,2\r\n3,4\r\n");
    const MatrixXd x = load_matrix(path, true);
    ASSERT_EQ(x.rows(), 2);
    EXPECT_DOUBLE_EQ(x(1, 0), 3.0);
}

TEST_F(CsvIoTest, LoadsLabelsFromIdPredictionPairs) {
    write("Id,Prediction\n1,4\n2,0\n3,9\n");
    const VectorXi y = load_labels(path, true);
    VectorXi want(3);
    want << 4, 0, 9;
    EXPECT_EQ(y, want);
}

TEST_F(CsvIoTest, RejectsMalformedInput) {
    write("1,2\n3\n");
    EXPECT_THROW(load_matrix(path), std::runtime_error);
    write("1,x\n");
    EXPECT_THROW(load_matrix(path), std::runtime_error);
    write("1.5\n");
    EXPECT_THROW(load_labels(path), std::runtime_error);
    EXPECT_THROW(load_matrix(path + ".missing"), std::runtime_error);
}

TEST_F(CsvIoTest, SavesPredictionsWithOneBasedIds) {
    VectorXi labels(3);
    labels << 2, 0, 1;
    save_predictions(path, labels);
    const VectorXi back = load_labels(path, true);
    EXPECT_EQ(back, labels);

    std::ifstream in(path);
    std::string header, first;
    std::getline(in, header);
    std::getline(in, first);
    EXPECT_EQ(header, "Id,Prediction");
    EXPECT_EQ(first, "1,2");
}
