#include "../include/kridge_bits/kernel_registry.hpp"
#include "../include/kridge_bits/errors.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace kridge {

std::string kernel_kind_name(KernelKind kind) {
    switch (kind) {
        case KernelKind::Linear: return "linear";
        case KernelKind::Poly: return "poly";
        case KernelKind::Rbf: return "rbf";
        case KernelKind::Laplacian: return "laplacian";
    }
    throw std::invalid_argument("invalid kernel kind");
}

KernelKind parse_kernel_kind(const std::string& name) {
    if (name == "linear") return KernelKind::Linear;
    if (name == "poly") return KernelKind::Poly;
    if (name == "rbf") return KernelKind::Rbf;
    if (name == "laplacian") return KernelKind::Laplacian;
    throw UnsupportedKernelError(name);
}

namespace {

const KernelKind kBuiltinKinds[] = {KernelKind::Linear, KernelKind::Poly, KernelKind::Rbf, KernelKind::Laplacian};

bool is_builtin(const std::string& name) {
    for (KernelKind kind : kBuiltinKinds) {
        if (kernel_kind_name(kind) == name) {
            return true;
        }
    }
    return false;
}

int poly_degree(double param) {
    const double degree = std::round(param);
    if (!(degree >= 1.0) || degree > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("polynomial kernel degree must be an integer in [1, "
                                    + std::to_string(std::numeric_limits<int>::max()) + "], got "
                                    + std::to_string(param));
    }
    return static_cast<int>(degree);
}

KernelFactory factory_for(KernelKind kind) {
    switch (kind) {
        case KernelKind::Linear:
            return [](const MatrixXd& x, double) {
                return std::unique_ptr<Kernel>(new LinearKernel(x));
            };
        case KernelKind::Poly:
            return [](const MatrixXd& x, double degree) {
                return std::unique_ptr<Kernel>(new PolyKernel(x, poly_degree(degree)));
            };
        case KernelKind::Rbf:
            return [](const MatrixXd& x, double gamma) {
                return std::unique_ptr<Kernel>(new GaussianKernel(x, gamma));
            };
        case KernelKind::Laplacian:
            return [](const MatrixXd& x, double gamma) {
                return std::unique_ptr<Kernel>(new LaplacianKernel(x, gamma));
            };
    }
    throw std::invalid_argument("invalid kernel kind");
}

}

void check_kernel_parameter(KernelKind kind, double param) {
    switch (kind) {
        case KernelKind::Linear:
            return;
        case KernelKind::Poly:
            poly_degree(param);
            return;
        case KernelKind::Rbf:
        case KernelKind::Laplacian:
            if (!(param > 0.0)) {
                throw std::invalid_argument(kernel_kind_name(kind) + " kernel gamma must be > 0, got "
                                            + std::to_string(param));
            }
            return;
    }
    throw std::invalid_argument("invalid kernel kind");
}

KernelRegistry KernelRegistry::defaults() {
    KernelRegistry registry;
    for (KernelKind kind : kBuiltinKinds) {
        registry.add(kernel_kind_name(kind), factory_for(kind));
    }
    return registry;
}

void KernelRegistry::add(const std::string& name, KernelFactory factory) {
    if (!factory) {
        throw std::invalid_argument("empty factory for kernel " + name);
    }
    _factories[name] = std::move(factory);
}

bool KernelRegistry::contains(const std::string& name) const {
    return _factories.find(name) != _factories.end();
}

std::vector<std::string> KernelRegistry::names() const {
    std::vector<std::string> res;
    for (const auto& entry : _factories) {
        res.push_back(entry.first);
    }
    return res;
}

void KernelRegistry::check(const std::string& name) const {
    if (!contains(name)) {
        throw UnsupportedKernelError(name);
    }
}

void KernelRegistry::check(const std::string& name, double param) const {
    check(name);
    if (is_builtin(name)) {
        check_kernel_parameter(parse_kernel_kind(name), param);
    }
}

std::unique_ptr<Kernel> KernelRegistry::make(const std::string& name, const MatrixXd& train_x, double param) const {
    auto it = _factories.find(name);
    if (it == _factories.end()) {
        throw UnsupportedKernelError(name);
    }
    return it->second(train_x, param);
}

}
