#pragma once

#include "tootbert/pipeline/pipeline_config.h"
#include <iostream>
#include <string>

namespace tootbert {
namespace commands {

// Global flags shared across all commands
struct GlobalFlags {
    bool quiet = false;     // Suppress informational output
    bool progress = false;  // Progress bar instead of one line per record
};

inline void print_info(const std::string& message, bool quiet) {
    if (!quiet) {
        std::cout << message << std::endl;
    }
}

inline void print_success(const std::string& message, bool quiet) {
    if (!quiet) {
        std::cout << "✓ " << message << std::endl;
    }
}

template <typename T>
inline void print_field(const std::string& name, const T& value, bool quiet) {
    if (!quiet) {
        std::cout << "  " << name << ": " << value << std::endl;
    }
}

// Classify every record of a FASTA file as transporter / non-transporter
// Usage: tootbert classify <input.fasta> <output> [--max-seq-len N] [--lr-model P] ...
int classify(const pipeline::PipelineConfig& config, const GlobalFlags& flags);

// Write pooled BERT features for every record of a FASTA file
// Usage: tootbert embed <input.fasta> <output.npy> [--max-seq-len N] [--model P] ...
int embed(const pipeline::PipelineConfig& config, const GlobalFlags& flags);

// Usage: tootbert version
int version();

}  // namespace commands
}  // namespace tootbert
