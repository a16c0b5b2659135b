#include <gtest/gtest.h>

#include <stdexcept>

#include <kridge>

using namespace kridge;

namespace {

MatrixXd rbf_matrix() {
    MatrixXd x(5, 2);
    x << 0.0, 0.0,
         1.0, 0.5,
         -0.5, 2.0,
         3.0, -1.0,
         0.25, 0.75;
    GaussianKernel kernel(x, 0.7);
    return kernel.similarity_matrix();
}

}

TEST(RidgeSolverTest, RegularizeAddsScaledIdentity) {
    const MatrixXd K = MatrixXd::Constant(3, 3, 2.0);
    const MatrixXd R = regularize(K, 0.5);
    for (Index i = 0; i < 3; i++) {
        for (Index j = 0; j < 3; j++) {
            EXPECT_DOUBLE_EQ(R(i, j), i == j ? 3.5 : 2.0);
        }
    }
    EXPECT_THROW(regularize(K, 0.0), std::invalid_argument);
    EXPECT_THROW(regularize(MatrixXd::Zero(2, 3), 1.0), ShapeMismatchError);
}

TEST(RidgeSolverTest, SolutionSatisfiesRegularizedSystem) {
    const MatrixXd K = rbf_matrix();
    VectorXd y(5);
    y << 1.0, -2.0, 0.5, 3.0, -1.0;
    const double c = 0.01;

    RidgeSolver solver(K, c);
    const VectorXd alpha = solver.solve(y);
    ASSERT_EQ(alpha.size(), 5);
    const VectorXd residual = regularize(K, c) * alpha - y;
    EXPECT_LT(residual.cwiseAbs().maxCoeff(), 1e-10);
}

TEST(RidgeSolverTest, SolveAllMatchesSingleSolves) {
    const MatrixXd K = rbf_matrix();
    MatrixXd Y(5, 3);
    Y << 1, -1, -1,
        -1, 1, -1,
        -1, -1, 1,
         1, -1, -1,
        -1, 1, -1;
    RidgeSolver solver(K, 0.1);
    const MatrixXd alpha = solver.solve_all(Y);
    ASSERT_EQ(alpha.rows(), 3);
    ASSERT_EQ(alpha.cols(), 5);
    for (Index k = 0; k < 3; k++) {
        const VectorXd single = solve_positive_definite(regularize(K, 0.1), Y.col(k));
        EXPECT_TRUE(alpha.row(k).transpose().isApprox(single, 1e-10)) << "class " << k;
    }
}

TEST(RidgeSolverTest, RankDeficientKernelBecomesSolvable) {
    // linear kernel over duplicated 1-D samples has rank one
    MatrixXd x(3, 1);
    x << 1.0, 1.0, 2.0;
    LinearKernel kernel(x);
    VectorXd y(3);
    y << 1.0, 1.0, 2.0;
    EXPECT_NO_THROW(RidgeSolver(kernel.similarity_matrix(), 0.01).solve(y));
}

TEST(RidgeSolverTest, IndefiniteSystemFails) {
    MatrixXd K(2, 2);
    K << 1.0, 2.0,
         2.0, 1.0;
    EXPECT_THROW(RidgeSolver(K, 0.1), SingularSystemError);
    EXPECT_THROW(solve_positive_definite(K, VectorXd::Ones(2)), SingularSystemError);
}

TEST(RidgeSolverTest, PositiveDefiniteSolveOnIdentity) {
    VectorXd b(3);
    b << 1.0, 2.0, 3.0;
    EXPECT_TRUE(solve_positive_definite(MatrixXd::Identity(3, 3), b).isApprox(b));
}

TEST(RidgeSolverTest, RejectsMismatchedTargets) {
    RidgeSolver solver(rbf_matrix(), 1.0);
    EXPECT_EQ(solver.size(), 5);
    EXPECT_THROW(solver.solve(VectorXd::Ones(4)), ShapeMismatchError);
    EXPECT_THROW(solver.solve_all(MatrixXd::Ones(6, 2)), ShapeMismatchError);
    EXPECT_THROW(solve_positive_definite(MatrixXd::Identity(2, 2), VectorXd::Ones(3)), ShapeMismatchError);
    EXPECT_THROW(RidgeSolver(MatrixXd(0, 0), 1.0), ShapeMismatchError);
}
