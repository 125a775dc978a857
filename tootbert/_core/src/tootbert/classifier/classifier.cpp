#include "classifier.h"
#include "tootbert/errors/messages.h"

namespace tootbert {
namespace classifier {

types::Label classify(const Classifier& clf, const types::FeatureVector& features) {
    const int width = static_cast<int>(features.size());
    if (width != clf.input_dim()) {
        throw errors::messages::feature_width_mismatch(width, clf.input_dim());
    }

    try {
        return clf.predict(features);
    } catch (const errors::ClassificationError&) {
        throw;
    } catch (const errors::TootBertError& e) {
        throw errors::ClassificationError(e.message());
    } catch (const std::exception& e) {
        throw errors::ClassificationError(e.what());
    }
}

}  // namespace classifier
}  // namespace tootbert
