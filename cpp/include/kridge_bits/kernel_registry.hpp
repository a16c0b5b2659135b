#ifndef KRIDGE_KERNEL_REGISTRY_H
#define KRIDGE_KERNEL_REGISTRY_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "kernel.hpp"

namespace kridge {

enum class KernelKind { Linear, Poly, Rbf, Laplacian };

std::string kernel_kind_name(KernelKind kind);
// throws UnsupportedKernelError
KernelKind parse_kernel_kind(const std::string& name);

// linear ignores param, poly needs round(param) in [1, INT_MAX], rbf and laplacian need param > 0.
// Throws std::invalid_argument.
void check_kernel_parameter(KernelKind kind, double param);

// builds a kernel over train_x; param is gamma for rbf/laplacian, degree for poly
typedef std::function<std::unique_ptr<Kernel>(const MatrixXd& train_x, double param)> KernelFactory;

// Name -> factory table. Estimators own a copy, nothing is looked up globally.
class KernelRegistry {
public:
    KernelRegistry() = default;

    // linear, poly, rbf, laplacian
    static KernelRegistry defaults();

    void add(const std::string& name, KernelFactory factory);
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    // throws UnsupportedKernelError if name is unknown
    void check(const std::string& name) const;
    // also validates param for the built-in names; custom factories check their own
    void check(const std::string& name, double param) const;
    std::unique_ptr<Kernel> make(const std::string& name, const MatrixXd& train_x, double param) const;

private:
    std::map<std::string, KernelFactory> _factories;
};

}

#endif
