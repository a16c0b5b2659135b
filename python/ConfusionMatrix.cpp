#include "../cpp/include/kridge_bits/ConfusionMatrix.hpp"

#include <sstream>

#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include <pybind11/pybind11.h>

namespace py = pybind11;
using namespace kridge;

void init_ConfusionMatrix(py::module &m){
    py::class_<ConfusionMatrix>(m,"ConfusionMatrix")
            .def(py::init<const std::vector<int>&>(), py::arg("classes"))
            .def("AddPrediction",&ConfusionMatrix::AddPrediction)
            .def("GetCount",&ConfusionMatrix::GetCount)
            .def("GetTotal",&ConfusionMatrix::GetTotal)
            .def("f_score",&ConfusionMatrix::f_score)
            .def("precision",&ConfusionMatrix::precision)
            .def("error_rate",&ConfusionMatrix::error_rate)
            .def("detection_rate",&ConfusionMatrix::detection_rate)
            .def_property_readonly("classes",&ConfusionMatrix::classes)
            .def_property_readonly("counts",&ConfusionMatrix::counts)
            .def("PrintEvaluation",[](const ConfusionMatrix& matrix) {
                std::ostringstream out;
                matrix.PrintEvaluation(out);
                py::print(out.str());
            });
}
