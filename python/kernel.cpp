#include "../cpp/include/kridge_bits/kernel.hpp"
#include "../cpp/include/kridge_bits/kernel_registry.hpp"
#include "../cpp/include/kridge_bits/ridge_solver.hpp"

#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include <pybind11/pybind11.h>

namespace py = pybind11;
using namespace kridge;

void init_kernel(py::module &m) {
    py::class_<Kernel>(m, "Kernel")
    .def("val", &Kernel::val)
    .def("name", &Kernel::name)
    .def("similarity_matrix", &Kernel::similarity_matrix, py::return_value_policy::copy)
    .def("similarity", &Kernel::similarity)
    .def_property_readonly("n_samples", &Kernel::n_samples)
    .def_property_readonly("n_features", &Kernel::n_features);

    py::class_<LinearKernel, Kernel>(m, "LinearKernel")
    .def(py::init<const MatrixXd&>(), py::arg("train_x"));

    py::class_<PolyKernel, Kernel>(m, "PolyKernel")
    .def(py::init<const MatrixXd&, int, double>(), py::arg("train_x"), py::arg("degree"), py::arg("c") = 1.0);

    py::class_<GaussianKernel, Kernel>(m, "GaussianKernel")
    .def(py::init<const MatrixXd&, double>(), py::arg("train_x"), py::arg("gamma"));

    py::class_<LaplacianKernel, Kernel>(m, "LaplacianKernel")
    .def(py::init<const MatrixXd&, double>(), py::arg("train_x"), py::arg("gamma"));

    m.def("make_kernel", [](const std::string& name, const MatrixXd& train_x, double param) {
        return KernelRegistry::defaults().make(name, train_x, param);
    }, py::arg("name"), py::arg("train_x"), py::arg("param"));
    m.def("kernel_names", []() { return KernelRegistry::defaults().names(); });

    m.def("regularize", &regularize, py::arg("K"), py::arg("C"));
    m.def("solve_positive_definite", &solve_positive_definite, py::arg("a"), py::arg("b"));
}
