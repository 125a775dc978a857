#include "commands.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

#include "tootbert/common/perf_timer.h"
#include "tootbert/common/progress_bar.h"
#include "tootbert/errors/messages.h"
#include "tootbert/errors/validators.h"
#include "tootbert/io/fasta_reader.h"
#include "tootbert/io/npy_writer.h"
#include "tootbert/io/result_writer.h"
#include "tootbert/pipeline/batch_runner.h"

namespace tootbert {
namespace commands {

namespace {

void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw errors::messages::file_write_error(path, "cannot open file");
    }
    for (const auto& line : lines) {
        out << line << '\n';
    }
    if (!out) {
        throw errors::messages::file_write_error(path, "write failed");
    }
}

}  // namespace

int embed(const pipeline::PipelineConfig& config, const GlobalFlags& flags) {
    const bool quiet = flags.quiet;
    const std::string ids_path = config.output_path + ".ids";
    const std::string problem_path = config.resolved_problem_path();

    if (!quiet) {
        std::cout << "===========================================\n";
        std::cout << "  tootbert embed\n";
        std::cout << "===========================================\n\n";
    }
    print_field("Input", config.input_path, quiet);
    print_field("Output", config.output_path, quiet);
    print_field("Max seq len", config.max_seq_len, quiet);

    std::vector<types::SequenceRecord> records;
    try {
        validation::validate_range(config.max_seq_len, 2, 1 << 20, "max_seq_len");
        validation::validate_output_path(config.output_path);
        records = io::FastaReader::read_file(config.input_path);
    } catch (const errors::TootBertError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    }
    print_field("Records", records.size(), quiet);
    print_info("", quiet);

    pipeline::ModelHandles handles;
    try {
        perf::PerfTimer timer("load_models");
        print_info("Loading BERT model and tokenizer...", quiet);
        handles = pipeline::load_encoder(config);
    } catch (const errors::TootBertError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    }
    print_success("Loaded encoder (hidden size " + std::to_string(handles.model->hidden_dim()) +
                      ", device " + handles.model->device() + ")",
                  quiet);

    try {
        pipeline::BatchRunner runner(handles, config.max_seq_len);

        std::vector<std::vector<float>> features;
        std::vector<std::string> ids;
        std::vector<std::string> problems;

        {
            perf::PerfTimer timer("embed_batch");
            std::unique_ptr<common::ScopedProgressBar> bar;
            if (flags.progress && !quiet) {
                bar = std::make_unique<common::ScopedProgressBar>(
                    static_cast<int>(records.size()), "sequences");
            }
            runner.run_features(records, [&](size_t, const pipeline::FeatureOutcome& outcome) {
                if (const auto* row = std::get_if<pipeline::FeatureRow>(&outcome)) {
                    ids.push_back(row->id);
                    features.push_back(row->features);
                    if (bar) bar->tick(false);
                } else {
                    const auto& problem = std::get<types::ProblemRecord>(outcome);
                    problems.push_back(io::format_problem_line(problem));
                    if (bar) {
                        bar->tick(true);
                    } else if (!quiet) {
                        std::cout << "Problem with sequence " << problem.id
                                  << ", skipping to the next one." << std::endl;
                    }
                }
            });
            timer.set_records(records.size());
        }

        io::save_feature_matrix(config.output_path, features, handles.model->hidden_dim());
        write_lines(ids_path, ids);
        write_lines(problem_path, problems);

        print_success("Wrote " + std::to_string(features.size()) + " feature vectors", quiet);
        print_field("Features", config.output_path, quiet);
        print_field("Ids", ids_path, quiet);
        print_field("Problems", std::to_string(problems.size()) + " (" + problem_path + ")",
                    quiet);
    } catch (const errors::TootBertError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    }

    print_info("Finished.", quiet);
    return 0;
}

}  // namespace commands
}  // namespace tootbert
