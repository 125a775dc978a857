#pragma once

#include <string>

namespace tootbert {
namespace pipeline {

/**
 * Run configuration, filled from the command line.
 *
 * Defaults follow the published TooT-BERT-T setup.
 */
struct PipelineConfig {
    std::string input_path;
    std::string output_path;
    std::string problem_path;  // Empty: "<output_path>.problem-sequences"

    int max_seq_len;             // Tokens including [CLS]/[SEP] (default: 20000)
    std::string model_path;      // safetensors file or directory (default: models/TransporterBERT)
    std::string tokenizer_path;  // vocab.txt or directory (default: models/prot_bert_bfd)
    std::string lr_model_path;   // classifier safetensors (default: lr_model.safetensors)
    int num_heads;               // Attention heads when the weights don't say (default: 16)
    std::string device;          // "auto" or "cpu" (default: auto)
    int num_threads;             // OpenMP threads, 0 = runtime default

    PipelineConfig()
        : max_seq_len(20000),
          model_path("models/TransporterBERT"),
          tokenizer_path("models/prot_bert_bfd"),
          lr_model_path("lr_model.safetensors"),
          num_heads(16),
          device("auto"),
          num_threads(0) {
    }

    std::string resolved_problem_path() const {
        return problem_path.empty() ? output_path + ".problem-sequences" : problem_path;
    }
};

}  // namespace pipeline
}  // namespace tootbert
