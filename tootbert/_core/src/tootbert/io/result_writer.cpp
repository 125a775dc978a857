#include "result_writer.h"
#include "tootbert/errors/messages.h"

namespace tootbert {
namespace io {

std::string format_prediction_line(const types::Prediction& prediction) {
    return "Sequence:" + prediction.id + "\tPrediction:" + prediction.label;
}

std::string format_problem_line(const types::ProblemRecord& problem) {
    return "Problem with sequence " + problem.id + ": " + problem.message;
}

ResultWriter::ResultWriter(const std::string& results_path, const std::string& problems_path)
    : results_path_(results_path),
      problems_path_(problems_path),
      results_(results_path, std::ios::out | std::ios::trunc),
      problems_(problems_path, std::ios::out | std::ios::trunc) {
    if (!results_) {
        throw errors::messages::file_write_error(results_path, "cannot open results file");
    }
    if (!problems_) {
        throw errors::messages::file_write_error(problems_path, "cannot open problems file");
    }
}

void ResultWriter::write_line(std::ofstream& out, const std::string& path,
                              const std::string& line) {
    out << line << '\n';
    out.flush();
    if (!out) {
        throw errors::messages::file_write_error(path, "write failed");
    }
}

void ResultWriter::write_prediction(const types::Prediction& prediction) {
    write_line(results_, results_path_, format_prediction_line(prediction));
    prediction_count_++;
}

void ResultWriter::write_problem(const types::ProblemRecord& problem) {
    write_line(problems_, problems_path_, format_problem_line(problem));
    problem_count_++;
}

void ResultWriter::write(const pipeline::RecordOutcome& outcome) {
    if (const auto* p = std::get_if<types::Prediction>(&outcome)) {
        write_prediction(*p);
    } else {
        write_problem(std::get<types::ProblemRecord>(outcome));
    }
}

}  // namespace io
}  // namespace tootbert
