#pragma once

#include "tootbert/pipeline/record_pipeline.h"
#include <fstream>
#include <string>

namespace tootbert {
namespace io {

/// "Sequence:{id}\tPrediction:{label}"
std::string format_prediction_line(const types::Prediction& prediction);

/// "Problem with sequence {id}: {message}"
std::string format_problem_line(const types::ProblemRecord& problem);

/**
 * Writes outcomes to the results and problems files.
 *
 * Both files are truncated on open. Every line is flushed as soon as it is
 * written so partial results survive an interrupted run.
 */
class ResultWriter {
public:
    /**
     * @throws FileWriteError if either file cannot be opened
     */
    ResultWriter(const std::string& results_path, const std::string& problems_path);

    /**
     * @throws FileWriteError if the write fails
     */
    void write(const pipeline::RecordOutcome& outcome);
    void write_prediction(const types::Prediction& prediction);
    void write_problem(const types::ProblemRecord& problem);

    size_t predictions_written() const { return prediction_count_; }
    size_t problems_written() const { return problem_count_; }

    const std::string& results_path() const { return results_path_; }
    const std::string& problems_path() const { return problems_path_; }

private:
    static void write_line(std::ofstream& out, const std::string& path, const std::string& line);

    std::string results_path_;
    std::string problems_path_;
    std::ofstream results_;
    std::ofstream problems_;
    size_t prediction_count_ = 0;
    size_t problem_count_ = 0;
};

}  // namespace io
}  // namespace tootbert
