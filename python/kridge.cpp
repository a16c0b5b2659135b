#include <pybind11/pybind11.h>

namespace py = pybind11;

void init_kernel(py::module &);
void init_kernel_ridge(py::module &);
void init_preprocessing(py::module &);
void init_ConfusionMatrix(py::module &);

PYBIND11_MODULE(kridge, m) {
    m.doc() = "Kernel ridge regression and one-vs-all classification";

    init_kernel(m);
    init_preprocessing(m);
    init_ConfusionMatrix(m);
    init_kernel_ridge(m);
}
