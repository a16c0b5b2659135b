#include <kridge>

#include <boost/program_options.hpp>

#include <fstream>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;
using namespace kridge;

int main(int argc, char** argv) {
    po::options_description desc("Allowed options");
    desc.add_options()
            ("help,h", "produce help message")
            ("config", po::value<std::string>(), "INI style file with any of the options below")
            ("model", po::value<std::string>()->default_value("classifier"), "regressor, classifier or augmented")
            ("C", po::value<double>()->default_value(1.0), "regularization constant")
            ("kernel", po::value<std::string>()->default_value("rbf"), "linear, poly, rbf or laplacian")
            ("gamma", po::value<double>()->default_value(10.0), "kernel scale (degree for poly)")
            ("flip-ratio", po::value<double>()->default_value(0.2), "share of training images flipped")
            ("rot-replicas", po::value<int>()->default_value(1), "rotation passes over the training set")
            ("rot-ratio", po::value<double>()->default_value(0.2), "share of training images rotated per pass")
            ("rot-angle", po::value<double>()->default_value(20.0), "maximum rotation in degrees")
            ("seed", po::value<unsigned int>()->default_value(0), "augmentation seed")
            ("image-height", po::value<int>()->default_value(32), "image height")
            ("image-width", po::value<int>()->default_value(32), "image width")
            ("image-channels", po::value<int>()->default_value(3), "image channels")
            ("hog-cell", po::value<int>()->default_value(8), "HOG cell size in pixels")
            ("hog-bins", po::value<int>()->default_value(9), "HOG orientation bins")
            ("train-x", po::value<std::string>(), "training samples, one per line")
            ("train-y", po::value<std::string>(), "training labels or targets")
            ("test-x", po::value<std::string>(), "samples to predict")
            ("output", po::value<std::string>()->default_value("predictions.csv"), "where predictions are written")
            ("has-header", po::value<bool>()->default_value(false), "input files start with a header line")
            ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warning or error");

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("config")) {
            const std::string path = vm["config"].as<std::string>();
            std::ifstream config(path);
            if (!config) {
                throw std::runtime_error("cannot open config file " + path);
            }
            po::store(po::parse_config_file(config, desc), vm);
        }
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        init_logging(vm["log-level"].as<std::string>());

        for (const char* required : {"train-x", "train-y", "test-x"}) {
            if (!vm.count(required)) {
                throw po::required_option(required);
            }
        }
        const bool header = vm["has-header"].as<bool>();
        const MatrixXd train_x = load_matrix(vm["train-x"].as<std::string>(), header);
        const MatrixXd test_x = load_matrix(vm["test-x"].as<std::string>(), header);
        const std::string model = vm["model"].as<std::string>();
        const std::string output = vm["output"].as<std::string>();
        const double c = vm["C"].as<double>();
        const std::string kernel = vm["kernel"].as<std::string>();
        const double gamma = vm["gamma"].as<double>();

        if (model == "regressor") {
            // targets are real valued, read them as a one column matrix
            const MatrixXd train_y = load_matrix(vm["train-y"].as<std::string>(), header);
            if (train_y.cols() < 1) {
                throw std::runtime_error("no training targets");
            }
            KernelRidgeRegressor regressor(c, kernel, gamma);
            regressor.fit(train_x, train_y.col(train_y.cols() - 1));
            KRIDGE_LOG_INFO("Training mean squared error: " << regressor.score(train_x, train_y.col(train_y.cols() - 1)));
            save_predictions(output, regressor.predict(test_x));
        } else if (model == "classifier" || model == "augmented") {
            const VectorXi train_y = load_labels(vm["train-y"].as<std::string>(), header);
            std::unique_ptr<KernelRidgeClassifier> classifier;
            if (model == "classifier") {
                classifier.reset(new KernelRidgeClassifier(c, kernel, gamma));
            } else {
                const ImageShape shape(vm["image-height"].as<int>(), vm["image-width"].as<int>(),
                                       vm["image-channels"].as<int>());
                classifier.reset(new AugmentedHogKernelRidgeClassifier(
                        shape, c, kernel, gamma, vm["flip-ratio"].as<double>(), vm["rot-replicas"].as<int>(),
                        vm["rot-ratio"].as<double>(), vm["rot-angle"].as<double>(), vm["seed"].as<unsigned int>(),
                        vm["hog-cell"].as<int>(), vm["hog-bins"].as<int>()));
            }
            classifier->fit(train_x, train_y);
            KRIDGE_LOG_INFO("Training error rate: " << classifier->score(train_x, train_y));
            save_predictions(output, classifier->predict(test_x));
        } else {
            throw std::invalid_argument("unknown model: " + model);
        }
        KRIDGE_LOG_INFO("Predictions written to " << output);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n" << desc << std::endl;
        return 2;
    } catch (const std::exception& e) {
        KRIDGE_LOG_ERROR(e.what());
        return 1;
    }
    return 0;
}
