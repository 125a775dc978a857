#include "commands.h"
#include <iostream>
#include <memory>
#include <vector>

#include "tootbert/common/perf_timer.h"
#include "tootbert/common/progress_bar.h"
#include "tootbert/errors/validators.h"
#include "tootbert/io/fasta_reader.h"
#include "tootbert/io/result_writer.h"
#include "tootbert/pipeline/batch_runner.h"

namespace tootbert {
namespace commands {

int classify(const pipeline::PipelineConfig& config, const GlobalFlags& flags) {
    const bool quiet = flags.quiet;
    const std::string problem_path = config.resolved_problem_path();

    // The whole file is parsed before any model is loaded or output opened,
    // so a malformed header anywhere fails the run with both files untouched.
    std::vector<types::SequenceRecord> records;
    try {
        validation::validate_range(config.max_seq_len, 2, 1 << 20, "max_seq_len");
        validation::validate_output_path(config.output_path);
        validation::validate_output_path(problem_path);
        records = io::FastaReader::read_file(config.input_path);
    } catch (const errors::TootBertError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    }

    // ========================================================================
    // Load models
    // ========================================================================
    pipeline::ModelHandles handles;
    try {
        perf::PerfTimer timer("load_models");

        print_info("Loading BERT model and tokenizer...", quiet);
        handles = pipeline::load_encoder(config);

        print_info("Loading logistic regression model...", quiet);
        pipeline::attach_classifier(handles, config);
    } catch (const errors::TootBertError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    }

    // ========================================================================
    // Classify
    // ========================================================================
    try {
        io::ResultWriter writer(config.output_path, problem_path);
        pipeline::BatchRunner runner(handles, config.max_seq_len);

        std::unique_ptr<common::ScopedProgressBar> bar;
        if (flags.progress && !quiet) {
            bar = std::make_unique<common::ScopedProgressBar>(static_cast<int>(records.size()),
                                                              "sequences");
        }
        const bool per_record_lines = !quiet && !bar;

        if (per_record_lines) {
            std::cout << "Sequence ID\t\tPredicted label\n";
            std::cout << "------------\t\t---------------\n";
        }

        pipeline::BatchSummary summary;
        {
            perf::PerfTimer timer("classify_batch");
            summary = runner.run(
                records,
                [&](size_t, const pipeline::RecordOutcome& outcome) {
                    writer.write(outcome);
                    const bool ok = pipeline::is_prediction(outcome);
                    if (bar) {
                        bar->tick(!ok);
                    } else if (per_record_lines) {
                        if (ok) {
                            const auto& p = std::get<types::Prediction>(outcome);
                            std::cout << p.id << "\t" << p.label << std::endl;
                        } else {
                            std::cout << "Problem with sequence " << pipeline::outcome_id(outcome)
                                      << ", skipping to the next one." << std::endl;
                        }
                    }
                });
            timer.set_records(summary.total);
        }
        bar.reset();

        if (!quiet && flags.progress) {
            print_field("Classified", summary.succeeded, quiet);
            print_field("Problems", summary.problems, quiet);
            print_field("Results", writer.results_path(), quiet);
            if (summary.problems > 0) {
                print_field("Problem list", writer.problems_path(), quiet);
            }
        }
    } catch (const errors::TootBertError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    }

    print_info("Finished.", quiet);
    return 0;
}

}  // namespace commands
}  // namespace tootbert
