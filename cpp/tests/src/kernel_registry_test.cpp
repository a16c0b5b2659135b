#include <gtest/gtest.h>

#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <kridge>

using namespace kridge;

TEST(KernelRegistryTest, DefaultsHoldBuiltinKernels) {
    const KernelRegistry registry = KernelRegistry::defaults();
    const std::vector<std::string> expected = {"laplacian", "linear", "poly", "rbf"};
    EXPECT_EQ(registry.names(), expected);
    for (const auto& name : expected) {
        EXPECT_TRUE(registry.contains(name));
        EXPECT_EQ(registry.make(name, MatrixXd::Identity(3, 2), 2.0)->name(), name);
    }
}

TEST(KernelRegistryTest, UnknownNameFails) {
    const KernelRegistry registry = KernelRegistry::defaults();
    EXPECT_FALSE(registry.contains("sigmoid"));
    EXPECT_THROW(registry.check("sigmoid"), UnsupportedKernelError);
    EXPECT_THROW(registry.make("sigmoid", MatrixXd::Identity(2, 2), 1.0), UnsupportedKernelError);
    try {
        registry.check("sigmoid");
        FAIL() << "expected UnsupportedKernelError";
    } catch (const UnsupportedKernelError& e) {
        EXPECT_EQ(e.name(), "sigmoid");
    }
}

TEST(KernelRegistryTest, KindNamesRoundTrip) {
    for (KernelKind kind : {KernelKind::Linear, KernelKind::Poly, KernelKind::Rbf, KernelKind::Laplacian}) {
        EXPECT_EQ(parse_kernel_kind(kernel_kind_name(kind)), kind);
    }
    EXPECT_THROW(parse_kernel_kind("RBF"), UnsupportedKernelError);
}

TEST(KernelRegistryTest, PolyDegreeIsRounded) {
    auto kernel = KernelRegistry::defaults().make("poly", MatrixXd::Identity(2, 2), 2.6);
    EXPECT_EQ(dynamic_cast<PolyKernel&>(*kernel).degree(), 3);
}

TEST(KernelRegistryTest, CustomKernelsCanBeAdded) {
    KernelRegistry registry;
    EXPECT_TRUE(registry.names().empty());
    registry.add("plain", [](const MatrixXd& x, double) { return std::unique_ptr<Kernel>(new LinearKernel(x)); });
    EXPECT_TRUE(registry.contains("plain"));
    EXPECT_FALSE(registry.contains("rbf"));

    KernelRidgeRegressor regressor(1.0, "plain", 1.0, registry);
    EXPECT_EQ(regressor.kernel_name(), "plain");
}

TEST(KernelRegistryTest, EstimatorsRejectUnknownKernelAtConstruction) {
    EXPECT_THROW(KernelRidgeRegressor(1.0, "sigmoid", 1.0), UnsupportedKernelError);
    EXPECT_THROW(KernelRidgeClassifier(1.0, "sigmoid", 1.0), UnsupportedKernelError);
    EXPECT_THROW(AugmentedHogKernelRidgeClassifier(ImageShape(), 1.0, "sigmoid"), UnsupportedKernelError);
}

TEST(KernelRegistryTest, PolyDegreeIsValidatedAtConstruction) {
    EXPECT_THROW(KernelRidgeClassifier(1.0, "poly", 0.4), std::invalid_argument);
    EXPECT_THROW(KernelRidgeRegressor(1.0, "poly", 5e9), std::invalid_argument);
    EXPECT_THROW(KernelRidgeRegressor(1.0, "poly", -3.0), std::invalid_argument);
    EXPECT_NO_THROW(KernelRidgeRegressor(1.0, "poly", 0.5));
    EXPECT_THROW(KernelRegistry::defaults().make("poly", MatrixXd::Identity(2, 2), 0.4), std::invalid_argument);
}

TEST(KernelRegistryTest, LinearKernelIgnoresGamma) {
    EXPECT_NO_THROW(check_kernel_parameter(KernelKind::Linear, 0.0));
    EXPECT_NO_THROW(check_kernel_parameter(KernelKind::Linear, -1.0));
    EXPECT_THROW(check_kernel_parameter(KernelKind::Rbf, 0.0), std::invalid_argument);
    EXPECT_THROW(check_kernel_parameter(KernelKind::Laplacian, -1.0), std::invalid_argument);

    KernelRidgeRegressor regressor(1e-6, "linear", 0.0);
    MatrixXd x(3, 1);
    x << 1.0, 2.0, 3.0;
    VectorXd y(3);
    y << 2.0, 4.0, 6.0;
    const VectorXd preds = regressor.fit(x, y).predict(x);
    for (int i = 0; i < 3; ++i) {
        EXPECT_NEAR(preds(i), y(i), 1e-3);
    }
}
