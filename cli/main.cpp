#include "tootbert/cli/cli.h"
#include "commands/commands.h"
#include <iostream>

using namespace tootbert::cli;

namespace {

// Options shared by classify and embed
void add_model_options(App* cmd, tootbert::pipeline::PipelineConfig& config) {
    cmd->add_option("--max-seq-len,-max_seq_len", config.max_seq_len,
                    "Maximum tokens per sequence including [CLS]/[SEP] (default: 20000)")
        ->check(Range(2, 1 << 20));
    cmd->add_option("--tokenizer,-tokenizer", config.tokenizer_path,
                    "Tokenizer vocab.txt or directory (default: models/prot_bert_bfd)");
    cmd->add_option("--model,-model", config.model_path,
                    "BERT weights (.safetensors) or directory (default: models/TransporterBERT)");
    cmd->add_option("--problem-file,-problem_file", config.problem_path,
                    "Problem sequences file (default: <output_file>.problem-sequences)");
    cmd->add_option("--num-heads", config.num_heads,
                    "Attention heads when the weights don't record them (default: 16)")
        ->check(Range(1, 1024));
    cmd->add_option("--device", config.device, "Compute device (default: auto)")
        ->check(IsMember({"auto", "cpu", "cuda", "mps"}));
    cmd->add_option("--threads", config.num_threads, "Worker threads (default: auto)")
        ->check(Range(0, 1024));
}

}  // namespace

int main(int argc, char** argv) {
    App app("tootbert", "Transporter classification with protein BERT embeddings");
    app.require_subcommand(true);

    // ========== Global Flags ==========
    tootbert::commands::GlobalFlags flags;
    app.add_flag("--quiet", flags.quiet, "Suppress informational output (only show errors)");
    app.add_flag("--progress", flags.progress, "Show a progress bar instead of per-record lines");

    // ========== Classify Subcommand ==========
    App* classify_cmd =
        app.add_subcommand("classify", "Classify FASTA sequences as transporter or not");

    tootbert::pipeline::PipelineConfig classify_config;
    classify_cmd->add_positional("input_file", classify_config.input_path, "Input FASTA file")
        ->check(ExistingFile());
    classify_cmd->add_positional("output_file", classify_config.output_path,
                                 "Output results file");
    classify_cmd->add_option("--lr-model,-lr_model", classify_config.lr_model_path,
                             "Logistic regression model (default: lr_model.safetensors)");
    add_model_options(classify_cmd, classify_config);

    // ========== Embed Subcommand ==========
    App* embed_cmd = app.add_subcommand("embed", "Write pooled BERT features to .npy");

    tootbert::pipeline::PipelineConfig embed_config;
    embed_cmd->add_positional("input_file", embed_config.input_path, "Input FASTA file")
        ->check(ExistingFile());
    embed_cmd->add_positional("output_file", embed_config.output_path,
                              "Output feature matrix (.npy)");
    add_model_options(embed_cmd, embed_config);

    // ========== Version Subcommand ==========
    App* version_cmd = app.add_subcommand("version", "Show version information");

    TOOTBERT_PARSE(app, argc, argv);

    if (app.get_active_subcommand() == classify_cmd) {
        return tootbert::commands::classify(classify_config, flags);
    } else if (app.get_active_subcommand() == embed_cmd) {
        return tootbert::commands::embed(embed_config, flags);
    } else if (app.get_active_subcommand() == version_cmd) {
        return tootbert::commands::version();
    }

    std::cerr << "Error: No subcommand selected" << std::endl;
    return 1;
}
