#include "../cpp/include/kridge_bits/errors.hpp"
#include "../cpp/include/kridge_bits/kernel_ridge.hpp"

#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include <pybind11/pybind11.h>

namespace py = pybind11;
using namespace kridge;

void init_kernel_ridge(py::module &m) {
    py::register_exception<UnsupportedKernelError>(m, "UnsupportedKernelError", PyExc_ValueError);
    py::register_exception<SingularSystemError>(m, "SingularSystemError", PyExc_ArithmeticError);
    py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError", PyExc_ValueError);

    py::class_<KernelRidgeRegressor>(m, "KernelRidgeRegressor")
    .def(py::init<double, const std::string&, double>(), py::arg("C") = 1.0, py::arg("kernel") = "rbf",
         py::arg("gamma") = 10.0)
    .def("fit", &KernelRidgeRegressor::fit, py::return_value_policy::reference_internal)
    .def("predict", &KernelRidgeRegressor::predict)
    .def("score", &KernelRidgeRegressor::score)
    .def_property_readonly("C", &KernelRidgeRegressor::c)
    .def_property_readonly("kernel", &KernelRidgeRegressor::kernel_name)
    .def_property_readonly("gamma", &KernelRidgeRegressor::gamma)
    .def_property_readonly("alpha", &KernelRidgeRegressor::alpha);

    py::class_<KernelRidgeClassifier>(m, "KernelRidgeClassifier")
    .def(py::init<double, const std::string&, double>(), py::arg("C") = 1.0, py::arg("kernel") = "rbf",
         py::arg("gamma") = 10.0)
    .def("fit", &KernelRidgeClassifier::fit, py::return_value_policy::reference_internal)
    .def("predict", &KernelRidgeClassifier::predict)
    .def("decision_function", &KernelRidgeClassifier::decision_function)
    .def("score", &KernelRidgeClassifier::score)
    .def("evaluate", &KernelRidgeClassifier::evaluate)
    .def_property_readonly("C", &KernelRidgeClassifier::c)
    .def_property_readonly("kernel", &KernelRidgeClassifier::kernel_name)
    .def_property_readonly("gamma", &KernelRidgeClassifier::gamma)
    .def_property_readonly("classes", &KernelRidgeClassifier::classes)
    .def_property_readonly("alpha", &KernelRidgeClassifier::alpha);

    py::class_<AugmentedHogKernelRidgeClassifier, KernelRidgeClassifier>(m, "AugmentedHogKernelRidgeClassifier")
    .def(py::init<const ImageShape&, double, const std::string&, double, double, int, double, double, unsigned int,
                  int, int>(),
         py::arg("shape") = ImageShape(), py::arg("C") = 1.0, py::arg("kernel") = "rbf", py::arg("gamma") = 10.0,
         py::arg("flip_ratio") = 0.2, py::arg("rot_replicas") = 1, py::arg("rot_ratio") = 0.2,
         py::arg("rot_angle") = 20.0, py::arg("seed") = 0, py::arg("cell_size") = 8, py::arg("n_bins") = 9)
    .def("fit", &AugmentedHogKernelRidgeClassifier::fit, py::return_value_policy::reference_internal);
}
