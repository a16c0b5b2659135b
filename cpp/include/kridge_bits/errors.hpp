#ifndef KRIDGE_ERRORS_H
#define KRIDGE_ERRORS_H

#include <stdexcept>
#include <string>

namespace kridge {

// kernel name not present in the registry
class UnsupportedKernelError : public std::invalid_argument {
public:
    explicit UnsupportedKernelError(const std::string& name)
        : std::invalid_argument("unsupported kernel: " + name), _name(name) {}

    const std::string& name() const { return _name; }

private:
    std::string _name;
};

// K + C*N*I failed the Cholesky factorization or produced non-finite coefficients
class SingularSystemError : public std::runtime_error {
public:
    explicit SingularSystemError(const std::string& what)
        : std::runtime_error(what) {}
};

class ShapeMismatchError : public std::invalid_argument {
public:
    explicit ShapeMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

class NotFittedError : public ShapeMismatchError {
public:
    explicit NotFittedError(const std::string& estimator)
        : ShapeMismatchError(estimator + " is not fitted yet, call fit() before predict()") {}
};

}

#endif
