/**
 * PyBind11 entry point for tootbert.
 *
 * Exposes sequence normalization, model loading, single-sequence
 * classification and the FASTA batch run.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include <algorithm>
#include <string>
#include <vector>

#include "tootbert/errors/error_categories.h"
#include "tootbert/errors/tootbert_error.h"
#include "tootbert/io/fasta_reader.h"
#include "tootbert/io/result_writer.h"
#include "tootbert/pipeline/batch_runner.h"
#include "tootbert/pipeline/model_handles.h"
#include "tootbert/pipeline/record_pipeline.h"
#include "tootbert/sequence/normalizer.h"
#include "tootbert/version.h"

namespace py = pybind11;

using tootbert::pipeline::ModelHandles;
using tootbert::pipeline::PipelineConfig;

namespace {

ModelHandles LoadModels(const std::string& model_path,
                        const std::string& tokenizer_path,
                        const std::string& lr_model_path,
                        int num_heads,
                        const std::string& device,
                        int num_threads,
                        bool with_classifier) {
    PipelineConfig config;
    config.model_path = model_path;
    config.tokenizer_path = tokenizer_path;
    config.lr_model_path = lr_model_path;
    config.num_heads = num_heads;
    config.device = device;
    config.num_threads = num_threads;

    py::gil_scoped_release release;
    return tootbert::pipeline::load_models(config, with_classifier);
}

// Returns (id, label) on success, (id, None, message) on a per-record failure
py::tuple ClassifySequence(const ModelHandles& handles,
                           const std::string& sequence,
                           const std::string& id,
                           int max_seq_len) {
    tootbert::types::SequenceRecord record{id, sequence, ""};
    tootbert::pipeline::RecordOutcome outcome;
    {
        py::gil_scoped_release release;
        outcome = tootbert::pipeline::classify_record(record, handles, max_seq_len);
    }
    if (const auto* p = std::get_if<tootbert::types::Prediction>(&outcome)) {
        return py::make_tuple(p->id, p->label);
    }
    const auto& problem = std::get<tootbert::types::ProblemRecord>(outcome);
    return py::make_tuple(problem.id, py::none(), problem.message);
}

py::array_t<float> EmbedSequence(const ModelHandles& handles,
                                 const std::string& sequence,
                                 int max_seq_len) {
    std::vector<float> features;
    {
        py::gil_scoped_release release;
        features = tootbert::pipeline::extract_features(sequence, *handles.tokenizer,
                                                        *handles.model, max_seq_len);
    }
    auto result = py::array_t<float>(static_cast<py::ssize_t>(features.size()));
    std::copy(features.begin(), features.end(), result.mutable_data());
    return result;
}

py::dict ClassifyFasta(const ModelHandles& handles,
                       const std::string& input_path,
                       const std::string& output_path,
                       const std::string& problem_path,
                       int max_seq_len,
                       py::object progress_callback) {
    PipelineConfig config;
    config.output_path = output_path;
    config.problem_path = problem_path;

    // Parse everything first so a bad header leaves no partial output
    const auto records = tootbert::io::FastaReader::read_file(input_path);
    tootbert::io::ResultWriter writer(output_path, config.resolved_problem_path());
    tootbert::pipeline::BatchRunner runner(handles, max_seq_len);

    auto summary = runner.run(
        records,
        [&](size_t index, const tootbert::pipeline::RecordOutcome& outcome) {
            writer.write(outcome);
            if (!progress_callback.is_none()) {
                progress_callback(index + 1, tootbert::pipeline::outcome_id(outcome),
                                  tootbert::pipeline::is_prediction(outcome));
            }
        });

    py::dict result;
    result["total"] = summary.total;
    result["succeeded"] = summary.succeeded;
    result["problems"] = summary.problems;
    result["results_path"] = writer.results_path();
    result["problems_path"] = writer.problems_path();
    return result;
}

}  // namespace

PYBIND11_MODULE(_tootbert_cpp, m) {
    m.doc() = "tootbert - transporter classification with protein BERT embeddings";
    m.attr("__version__") = tootbert::kVersion;

    // ----------------------- Custom Exception Types -----------------------
    static py::exception<tootbert::errors::TootBertError> exc_tootbert(m, "TootBertError");
    static py::exception<tootbert::errors::FileNotFoundError> exc_file_not_found(m, "FileNotFoundError", PyExc_FileNotFoundError);
    static py::exception<tootbert::errors::FileWriteError> exc_file_write(m, "FileWriteError", PyExc_OSError);
    static py::exception<tootbert::errors::ValidationError> exc_validation(m, "ValidationError", PyExc_ValueError);
    static py::exception<tootbert::errors::FormatError> exc_format(m, "FormatError", PyExc_ValueError);
    static py::exception<tootbert::errors::SetupError> exc_setup(m, "SetupError", PyExc_RuntimeError);
    static py::exception<tootbert::errors::RecordError> exc_record(m, "RecordError", PyExc_RuntimeError);

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const tootbert::errors::FileNotFoundError& e) {
            py::set_error(exc_file_not_found, e.formatted().c_str());
        } catch (const tootbert::errors::FileWriteError& e) {
            py::set_error(exc_file_write, e.formatted().c_str());
        } catch (const tootbert::errors::ValidationError& e) {
            py::set_error(exc_validation, e.formatted().c_str());
        } catch (const tootbert::errors::FormatError& e) {
            py::set_error(exc_format, e.formatted().c_str());
        } catch (const tootbert::errors::SetupError& e) {
            py::set_error(exc_setup, e.formatted().c_str());
        } catch (const tootbert::errors::RecordError& e) {
            py::set_error(exc_record, e.message().c_str());
        } catch (const tootbert::errors::TootBertError& e) {
            py::set_error(exc_tootbert, e.formatted().c_str());
        }
    });

    py::enum_<tootbert::errors::ErrorCategory>(m, "ErrorCategory")
        .value("FileIO", tootbert::errors::ErrorCategory::FileIO)
        .value("Validation", tootbert::errors::ErrorCategory::Validation)
        .value("Format", tootbert::errors::ErrorCategory::Format)
        .value("Setup", tootbert::errors::ErrorCategory::Setup)
        .value("Tokenization", tootbert::errors::ErrorCategory::Tokenization)
        .value("Inference", tootbert::errors::ErrorCategory::Inference)
        .value("Pooling", tootbert::errors::ErrorCategory::Pooling)
        .value("Classification", tootbert::errors::ErrorCategory::Classification)
        .export_values();

    // ----------------------- Models -----------------------
    py::class_<ModelHandles>(m, "ModelHandles")
        .def_property_readonly("hidden_dim",
                               [](const ModelHandles& h) { return h.model->hidden_dim(); })
        .def_property_readonly("vocab_size",
                               [](const ModelHandles& h) { return h.tokenizer->vocab_size(); })
        .def_property_readonly("device", [](const ModelHandles& h) { return h.model->device(); })
        .def_property_readonly("has_classifier", &ModelHandles::has_classifier);

    m.def("load_models",
          &LoadModels,
          py::arg("model_path") = "models/TransporterBERT",
          py::arg("tokenizer_path") = "models/prot_bert_bfd",
          py::arg("lr_model_path") = "lr_model.safetensors",
          py::arg("num_heads") = 16,
          py::arg("device") = "auto",
          py::arg("num_threads") = 0,
          py::arg("with_classifier") = true,
          "Load tokenizer, BERT encoder and (optionally) the logistic regression classifier.");

    // ----------------------- Per-sequence -----------------------
    m.def("normalize",
          &tootbert::sequence::normalize,
          py::arg("sequence"),
          "Space-separate residues and map U, O, B, Z to X.");

    m.def("classify_sequence",
          &ClassifySequence,
          py::arg("models"),
          py::arg("sequence"),
          py::arg("id") = "sequence",
          py::arg("max_seq_len") = 20000,
          "Classify one raw sequence. Returns (id, label) or (id, None, problem message).");

    m.def("embed_sequence",
          &EmbedSequence,
          py::arg("models"),
          py::arg("sequence"),
          py::arg("max_seq_len") = 20000,
          "Pooled BERT features of one raw sequence as a 1D float32 array.");

    // ----------------------- Batch -----------------------
    m.def("classify_fasta",
          &ClassifyFasta,
          py::arg("models"),
          py::arg("input_path"),
          py::arg("output_path"),
          py::arg("problem_path") = "",
          py::arg("max_seq_len") = 20000,
          py::arg("progress_callback") = py::none(),
          "Classify every record of a FASTA file, writing the results and problem files. "
          "progress_callback(index, id, ok) is called after each record.");
}
