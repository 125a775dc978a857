/**
 * Linear logistic-regression classifier.
 *
 * Stored as safetensors:
 *   - coef       [n_rows, n_features]
 *   - intercept  [n_rows]
 *   - __metadata__ "classes": comma-separated labels (default "0,1")
 *
 * n_rows == 1 is the binary form: classes[1] when w.x + b > 0, else
 * classes[0]. Otherwise there is one row per class and the highest
 * decision value wins (lowest index on ties). This matches the decision
 * rule of a fitted scikit-learn LogisticRegression.
 */

#pragma once

#include "classifier.h"
#include <memory>
#include <string>
#include <vector>

namespace tootbert {
namespace classifier {

class LogisticRegression : public Classifier {
public:
    /**
     * @param coef       Row-major [n_rows * n_features]
     * @param intercept  [n_rows]
     * @param classes    Labels; 2 for binary, n_rows otherwise
     * @throws ValidationError if the shapes do not agree
     */
    LogisticRegression(std::vector<float> coef, std::vector<float> intercept,
                       std::vector<std::string> classes, int n_features);

    /**
     * @throws FileNotFoundError, FormatError, SetupError
     */
    static std::shared_ptr<const LogisticRegression> load(const std::string& path);

    types::Label predict(const types::FeatureVector& features) const override;

    int input_dim() const override { return n_features_; }

    /// Raw decision values (one per coef row).
    std::vector<float> decision_function(const types::FeatureVector& features) const;

    const std::vector<std::string>& classes() const { return classes_; }

private:
    std::vector<float> coef_;
    std::vector<float> intercept_;
    std::vector<std::string> classes_;
    int n_features_;
    int n_rows_;
};

/// Split "a,b,c" into labels, trimming spaces around each.
std::vector<std::string> parse_class_labels(const std::string& csv);

}  // namespace classifier
}  // namespace tootbert
