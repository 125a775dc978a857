/**
 * Unit tests for the BERT encoder.
 *
 * The encoder is compared against a straightforward per-token reference
 * written directly from the Hugging Face weight layout.
 */

#include "tootbert/model/bert_model.h"
#include "tootbert/model/device.h"
#include "tootbert/model/embedding_model.h"
#include "tootbert/tools/weights/bert_weight_loader.h"
#include "tootbert/tools/weights/safetensors_loader.h"
#include "../../test_utils.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace tootbert;
using model::BertModel;
using test::throws_as;

namespace {

std::vector<float> reference_layer_norm(const std::vector<float>& x, const std::vector<float>& g,
                                        const std::vector<float>& b, float eps) {
    const size_t D = x.size();
    double mean = 0.0;
    for (float v : x) mean += v;
    mean /= D;
    double var = 0.0;
    for (float v : x) var += (v - mean) * (v - mean);
    var /= D;
    std::vector<float> out(D);
    for (size_t i = 0; i < D; i++) {
        out[i] = static_cast<float>((x[i] - mean) / std::sqrt(var + eps)) * g[i] + b[i];
    }
    return out;
}

// y = W x + b with W in [out, in] layout
std::vector<float> reference_linear(const std::vector<float>& x, const std::vector<float>& W,
                                    const std::vector<float>& b) {
    const size_t out_dim = b.size();
    const size_t in_dim = x.size();
    std::vector<float> y(out_dim);
    for (size_t o = 0; o < out_dim; o++) {
        double acc = b[o];
        for (size_t i = 0; i < in_dim; i++) acc += W[o * in_dim + i] * x[i];
        y[o] = static_cast<float>(acc);
    }
    return y;
}

std::vector<std::vector<float>> reference_forward(const weights::SafetensorsLoader& st,
                                                  const test::TinyBertShape& s,
                                                  const std::vector<int32_t>& ids,
                                                  const std::vector<int32_t>& mask) {
    const size_t L = ids.size();
    const size_t H = static_cast<size_t>(s.hidden);
    const int hd = s.hidden / s.heads;
    const float eps = 1e-12f;

    auto word = st.load_tensor("embeddings.word_embeddings.weight");
    auto pos = st.load_tensor("embeddings.position_embeddings.weight");
    auto type = st.load_tensor("embeddings.token_type_embeddings.weight");
    auto eg = st.load_tensor("embeddings.LayerNorm.weight");
    auto eb = st.load_tensor("embeddings.LayerNorm.bias");

    std::vector<std::vector<float>> h(L, std::vector<float>(H));
    for (size_t t = 0; t < L; t++) {
        for (size_t d = 0; d < H; d++) {
            h[t][d] = word[ids[t] * H + d] + pos[t * H + d] + type[d];
        }
        h[t] = reference_layer_norm(h[t], eg, eb, eps);
    }

    for (int l = 0; l < s.layers; l++) {
        const std::string p = "encoder.layer." + std::to_string(l) + ".";
        auto t_ = [&](const std::string& n) { return st.load_tensor(p + n); };
        auto qw = t_("attention.self.query.weight"), qb = t_("attention.self.query.bias");
        auto kw = t_("attention.self.key.weight"), kb = t_("attention.self.key.bias");
        auto vw = t_("attention.self.value.weight"), vb = t_("attention.self.value.bias");

        std::vector<std::vector<float>> q(L), k(L), v(L);
        for (size_t t = 0; t < L; t++) {
            q[t] = reference_linear(h[t], qw, qb);
            k[t] = reference_linear(h[t], kw, kb);
            v[t] = reference_linear(h[t], vw, vb);
        }

        std::vector<std::vector<float>> next(L);
        for (size_t i = 0; i < L; i++) {
            std::vector<float> ctx(H, 0.0f);
            for (int head = 0; head < s.heads; head++) {
                const int off = head * hd;
                std::vector<double> w(L);
                double mx = -1e300;
                for (size_t j = 0; j < L; j++) {
                    if (mask[j] == 0) continue;
                    double dot = 0.0;
                    for (int d = 0; d < hd; d++) dot += q[i][off + d] * k[j][off + d];
                    w[j] = dot / std::sqrt(static_cast<double>(hd));
                    if (w[j] > mx) mx = w[j];
                }
                double z = 0.0;
                for (size_t j = 0; j < L; j++) {
                    w[j] = mask[j] == 0 ? 0.0 : std::exp(w[j] - mx);
                    z += w[j];
                }
                for (size_t j = 0; j < L; j++) {
                    for (int d = 0; d < hd; d++) {
                        ctx[off + d] += static_cast<float>(w[j] / z) * v[j][off + d];
                    }
                }
            }

            auto attn = reference_linear(ctx, t_("attention.output.dense.weight"),
                                         t_("attention.output.dense.bias"));
            for (size_t d = 0; d < H; d++) attn[d] += h[i][d];
            auto h1 = reference_layer_norm(attn, t_("attention.output.LayerNorm.weight"),
                                           t_("attention.output.LayerNorm.bias"), eps);

            auto inter = reference_linear(h1, t_("intermediate.dense.weight"),
                                          t_("intermediate.dense.bias"));
            for (float& x : inter) x = 0.5f * x * (1.0f + std::erf(x / std::sqrt(2.0f)));
            auto out = reference_linear(inter, t_("output.dense.weight"), t_("output.dense.bias"));
            for (size_t d = 0; d < H; d++) out[d] += h1[d];
            next[i] = reference_layer_norm(out, t_("output.LayerNorm.weight"),
                                           t_("output.LayerNorm.bias"), eps);
        }
        h = next;
    }
    return h;
}

types::TokenBatch make_batch(const std::vector<int32_t>& ids) {
    types::TokenBatch b;
    b.input_ids = ids;
    b.attention_mask.assign(ids.size(), 1);
    return b;
}

}  // namespace

bool test_config_from_weights() {
    std::cout << "=== Test 1: Config inferred from tensor shapes ===" << std::endl;

    test::TinyBertShape shape;
    auto buf = test::make_tiny_bert(shape).bytes();
    weights::SafetensorsLoader loader(buf.data(), buf.size());
    auto loaded = weights::BertWeightLoader::load(loader, 16);
    const auto& c = loaded.second;

    std::cout << "  hidden=" << c.hidden_dim << " layers=" << c.num_layers
              << " heads=" << c.num_heads << " inter=" << c.intermediate_dim << std::endl;

    bool ok = c.vocab_size == 30 && c.hidden_dim == 8 && c.num_layers == 2 && c.num_heads == 2 &&
              c.intermediate_dim == 16 && c.max_positions == 64 && c.type_vocab_size == 2;

    // Without metadata the caller's head count is used
    auto buf2 = test::make_tiny_bert(shape, 7, "bert.", false).bytes();
    weights::SafetensorsLoader loader2(buf2.data(), buf2.size());
    ok &= weights::BertWeightLoader::load(loader2, 4).second.num_heads == 4;

    // A head count that does not divide the width is a setup failure
    ok &= throws_as<errors::SetupError>([&] { weights::BertWeightLoader::load(loader2, 3); });

    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_matches_reference() {
    std::cout << "=== Test 2: Forward pass matches reference ===" << std::endl;

    test::TinyBertShape shape;
    auto buf = test::make_tiny_bert(shape).bytes();
    weights::SafetensorsLoader loader(buf.data(), buf.size());
    auto loaded = weights::BertWeightLoader::load(loader, 16);
    BertModel bert(std::move(loaded.first), loaded.second);

    // [CLS] M K V L [SEP]
    std::vector<int32_t> ids = {2, 21, 12, 8, 5, 3};
    auto out = bert.infer(make_batch(ids));
    auto ref = reference_forward(loader, shape, ids, std::vector<int32_t>(ids.size(), 1));

    float max_err = 0.0f;
    for (int t = 0; t < out.rows; t++) {
        for (int d = 0; d < out.dim; d++) {
            max_err = std::max(max_err, std::abs(out.row(t)[d] - ref[t][d]));
        }
    }
    std::cout << "  max |err| = " << max_err << std::endl;

    if (out.rows != 6 || out.dim != 8 || max_err > 1e-3f) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_padding_invariance() {
    std::cout << "=== Test 3: Padding does not change attended rows ===" << std::endl;

    test::TinyBertShape shape;
    auto buf = test::make_tiny_bert(shape, 11).bytes();
    weights::SafetensorsLoader loader(buf.data(), buf.size());
    auto loaded = weights::BertWeightLoader::load(loader, 16);
    BertModel bert(std::move(loaded.first), loaded.second);

    types::TokenBatch plain = make_batch({2, 6, 7, 9, 3});
    types::TokenBatch padded = plain;
    for (int i = 0; i < 4; i++) {
        padded.input_ids.push_back(0);
        padded.attention_mask.push_back(0);
    }

    auto a = bert.infer(plain);
    auto b = bert.infer(padded);

    bool ok = b.rows == 9;
    for (int t = 0; t < plain.size() && ok; t++) {
        for (int d = 0; d < a.dim; d++) {
            ok &= test::close(a.row(t)[d], b.row(t)[d], 1e-4f);
        }
    }

    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_infer_errors() {
    std::cout << "=== Test 4: Invalid batches raise InferenceError ===" << std::endl;

    test::TinyBertShape shape;
    auto buf = test::make_tiny_bert(shape).bytes();
    weights::SafetensorsLoader loader(buf.data(), buf.size());
    auto loaded = weights::BertWeightLoader::load(loader, 16);
    BertModel bert(std::move(loaded.first), loaded.second);

    bool ok = true;
    ok &= throws_as<errors::InferenceError>([&] { bert.infer(types::TokenBatch()); });
    ok &= throws_as<errors::InferenceError>([&] { bert.infer(make_batch({2, 30, 3})); });
    ok &= throws_as<errors::InferenceError>([&] { bert.infer(make_batch({2, -1, 3})); });

    // Longer than the position table
    std::vector<int32_t> too_long(static_cast<size_t>(shape.max_positions) + 1, 6);
    ok &= throws_as<errors::InferenceError>([&] { bert.infer(make_batch(too_long)); });

    types::TokenBatch ragged = make_batch({2, 6, 3});
    ragged.attention_mask.pop_back();
    ok &= throws_as<errors::InferenceError>([&] { bert.infer(ragged); });

    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_embed_adapter() {
    std::cout << "=== Test 5: embed() wraps foreign failures ===" << std::endl;

    class FailingModel : public model::EmbeddingModel {
    public:
        types::EmbeddingMatrix infer(const types::TokenBatch&) const override {
            throw std::runtime_error("backend exploded");
        }
        int hidden_dim() const override { return 4; }
    };

    class WrongShapeModel : public model::EmbeddingModel {
    public:
        types::EmbeddingMatrix infer(const types::TokenBatch& b) const override {
            return types::EmbeddingMatrix(b.size() - 1, 4);
        }
        int hidden_dim() const override { return 4; }
    };

    types::TokenBatch batch = make_batch({2, 6, 3});
    test::StubEmbeddingModel stub(4);

    bool ok = model::embed(stub, batch).rows == 3;
    ok &= throws_as<errors::InferenceError>([&] { model::embed(FailingModel(), batch); });
    ok &= throws_as<errors::InferenceError>([&] { model::embed(WrongShapeModel(), batch); });

    try {
        model::embed(FailingModel(), batch);
    } catch (const errors::InferenceError& e) {
        ok &= std::string(e.what()).find("backend exploded") != std::string::npos;
    }

    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_load_and_device() {
    std::cout << "=== Test 6: BertModel::load and device selection ===" << std::endl;

    test::TempDir dir;
    test::make_tiny_bert().save(dir.file("model.safetensors"));

    bool ok = true;
    auto from_dir = BertModel::load(dir.path().string());
    ok &= from_dir->hidden_dim() == 8 && from_dir->device() == "cpu";

    auto from_file = BertModel::load(dir.file("model.safetensors"));
    ok &= from_file->config().num_layers == 2;

    ok &= throws_as<errors::FileNotFoundError>([&] { BertModel::load(dir.file("missing")); });

    ok &= model::resolve_device("auto") == "cpu";
    ok &= model::resolve_device("cpu") == "cpu";
    ok &= throws_as<errors::SetupError>([] { model::resolve_device("cuda"); });
    ok &= throws_as<errors::ValidationError>([] { model::resolve_device("tpu"); });

    model::BertModelOptions gpu;
    gpu.device = "mps";
    ok &= throws_as<errors::SetupError>([&] { BertModel::load(dir.path().string(), gpu); });

    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  BERT Encoder Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    int passed = 0;
    int total = 6;

    if (test_config_from_weights()) passed++;
    if (test_matches_reference()) passed++;
    if (test_padding_invariance()) passed++;
    if (test_infer_errors()) passed++;
    if (test_embed_adapter()) passed++;
    if (test_load_and_device()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
