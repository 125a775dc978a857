#include "logistic_regression.h"
#include "tootbert/errors/messages.h"
#include "tootbert/errors/validators.h"
#include "tootbert/tools/weights/safetensors_loader.h"
#include <cmath>

namespace tootbert {
namespace classifier {

namespace {

constexpr const char* kComponent = "classifier";

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

}  // namespace

std::vector<std::string> parse_class_labels(const std::string& csv) {
    std::vector<std::string> labels;
    size_t start = 0;
    while (true) {
        size_t comma = csv.find(',', start);
        labels.push_back(trim(csv.substr(start, comma == std::string::npos ? std::string::npos
                                                                           : comma - start)));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return labels;
}

LogisticRegression::LogisticRegression(std::vector<float> coef, std::vector<float> intercept,
                                       std::vector<std::string> classes, int n_features)
    : coef_(std::move(coef)),
      intercept_(std::move(intercept)),
      classes_(std::move(classes)),
      n_features_(n_features),
      n_rows_(static_cast<int>(intercept_.size())) {
    validation::validate_positive(n_features_, "n_features");
    validation::validate_positive(n_rows_, "intercept length");

    if (coef_.size() != static_cast<size_t>(n_rows_) * n_features_) {
        throw errors::ValidationError(
            "coef has " + std::to_string(coef_.size()) + " values, expected " +
            std::to_string(n_rows_) + " x " + std::to_string(n_features_));
    }
    const size_t expected_classes = (n_rows_ == 1) ? 2 : static_cast<size_t>(n_rows_);
    if (classes_.size() != expected_classes) {
        throw errors::ValidationError(
            std::to_string(classes_.size()) + " class labels for " + std::to_string(n_rows_) +
                " coefficient rows, expected " + std::to_string(expected_classes),
            "Set the 'classes' metadata to match the coef rows");
    }
}

std::shared_ptr<const LogisticRegression> LogisticRegression::load(const std::string& path) {
    const std::string file =
        validation::resolve_model_file(path, "lr_model.safetensors", "Classifier file");
    weights::SafetensorsLoader loader(file);

    for (const char* name : {"coef", "intercept"}) {
        if (!loader.has_tensor(name)) {
            throw errors::messages::missing_tensor(kComponent, name, file);
        }
    }

    const auto& coef_info = loader.get_info("coef");
    const auto& icpt_info = loader.get_info("intercept");
    if (coef_info.shape.size() != 2) {
        throw errors::messages::tensor_shape_mismatch(kComponent, "coef", coef_info.shape_string(),
                                                      "[n_rows, n_features]");
    }
    if (icpt_info.shape.size() != 1 || icpt_info.shape[0] != coef_info.shape[0]) {
        throw errors::messages::tensor_shape_mismatch(
            kComponent, "intercept", icpt_info.shape_string(),
            "[" + std::to_string(coef_info.shape[0]) + "]");
    }

    std::string classes_csv = loader.metadata_value("classes");
    std::vector<std::string> classes =
        classes_csv.empty() ? std::vector<std::string>{"0", "1"} : parse_class_labels(classes_csv);

    try {
        return std::make_shared<const LogisticRegression>(
            loader.load_tensor("coef"), loader.load_tensor("intercept"), std::move(classes),
            static_cast<int>(coef_info.shape[1]));
    } catch (const errors::ValidationError& e) {
        throw errors::SetupError(kComponent, e.message(), e.suggestion());
    }
}

std::vector<float> LogisticRegression::decision_function(const types::FeatureVector& features) const {
    if (static_cast<int>(features.size()) != n_features_) {
        throw errors::messages::feature_width_mismatch(static_cast<int>(features.size()),
                                                       n_features_);
    }
    for (float v : features) {
        if (!std::isfinite(v)) {
            throw errors::ClassificationError("feature vector contains non-finite values");
        }
    }

    std::vector<float> scores(static_cast<size_t>(n_rows_));
    for (int r = 0; r < n_rows_; r++) {
        const float* w = coef_.data() + static_cast<size_t>(r) * n_features_;
        double s = intercept_[r];
        for (int d = 0; d < n_features_; d++) {
            s += static_cast<double>(w[d]) * features[d];
        }
        scores[r] = static_cast<float>(s);
    }
    return scores;
}

types::Label LogisticRegression::predict(const types::FeatureVector& features) const {
    std::vector<float> scores = decision_function(features);

    if (n_rows_ == 1) {
        return scores[0] > 0.0f ? classes_[1] : classes_[0];
    }

    int best = 0;
    for (int r = 1; r < n_rows_; r++) {
        if (scores[r] > scores[best]) {
            best = r;
        }
    }
    return classes_[best];
}

}  // namespace classifier
}  // namespace tootbert
