#include "../cpp/include/kridge_bits/augmentation.hpp"
#include "../cpp/include/kridge_bits/hog.hpp"
#include "../cpp/include/kridge_bits/label_binarizer.hpp"

#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include <pybind11/pybind11.h>

namespace py = pybind11;
using namespace kridge;

void init_preprocessing(py::module &m) {
    py::class_<ImageShape>(m, "ImageShape")
    .def(py::init<int, int, int>(), py::arg("height") = 32, py::arg("width") = 32, py::arg("channels") = 3)
    .def_readonly("height", &ImageShape::height)
    .def_readonly("width", &ImageShape::width)
    .def_readonly("channels", &ImageShape::channels);

    py::class_<LabelBinarizer>(m, "LabelBinarizer")
    .def(py::init<double, double>(), py::arg("pos_label") = 1.0, py::arg("neg_label") = -1.0)
    .def("fit", &LabelBinarizer::fit, py::return_value_policy::reference_internal)
    .def("transform", &LabelBinarizer::transform)
    .def("fit_transform", &LabelBinarizer::fit_transform)
    .def("inverse_transform", &LabelBinarizer::inverse_transform)
    .def_property_readonly("classes", &LabelBinarizer::classes);

    py::class_<HogExtractor>(m, "HogExtractor")
    .def(py::init<const ImageShape&, int, int, int>(), py::arg("shape") = ImageShape(), py::arg("cell_size") = 8,
         py::arg("n_bins") = 9, py::arg("block_size") = 2)
    .def("transform", &HogExtractor::transform)
    .def_property_readonly("n_features", &HogExtractor::n_features);

    m.def("augment_dataset", [](const MatrixXd& x, const VectorXi& y, const ImageShape& shape, double flip_ratio,
                                int rot_replicas, double rot_ratio, double rot_angle, unsigned int seed) {
        std::mt19937 rng(seed);
        MatrixXd x_out;
        VectorXi y_out;
        augment_dataset(x, y, shape, AugmentationParams(flip_ratio, rot_replicas, rot_ratio, rot_angle), rng,
                        x_out, y_out);
        return py::make_tuple(x_out, y_out);
    }, py::arg("x"), py::arg("y"), py::arg("shape"), py::arg("flip_ratio") = 0.2, py::arg("rot_replicas") = 1,
       py::arg("rot_ratio") = 0.2, py::arg("rot_angle") = 20.0, py::arg("seed") = 0);
}
