#pragma once

#include "tootbert/types/pipeline_types.h"

namespace tootbert {
namespace classifier {

/**
 * Abstract classifier seam: feature vector in, label out.
 */
class Classifier {
public:
    virtual ~Classifier() = default;

    /**
     * @throws ClassificationError
     */
    virtual types::Label predict(const types::FeatureVector& features) const = 0;

    /// Expected feature width.
    virtual int input_dim() const = 0;
};

/**
 * Classifier adapter used by the pipeline.
 *
 * Checks the feature width, then converts any classifier failure into
 * ClassificationError.
 *
 * @throws ClassificationError
 */
types::Label classify(const Classifier& clf, const types::FeatureVector& features);

}  // namespace classifier
}  // namespace tootbert
