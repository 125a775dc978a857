#include "fasta_reader.h"
#include "tootbert/errors/messages.h"
#include <cctype>
#include <fstream>
#include <istream>

namespace tootbert {
namespace io {

namespace {

bool is_blank(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

}  // namespace

std::pair<std::string, std::string> split_header(const std::string& header) {
    size_t id_begin = 0;
    while (id_begin < header.size() && std::isspace(static_cast<unsigned char>(header[id_begin]))) {
        id_begin++;
    }
    size_t id_end = id_begin;
    while (id_end < header.size() && !std::isspace(static_cast<unsigned char>(header[id_end]))) {
        id_end++;
    }

    std::string id = header.substr(id_begin, id_end - id_begin);
    size_t desc_begin = id_end;
    while (desc_begin < header.size() &&
           std::isspace(static_cast<unsigned char>(header[desc_begin]))) {
        desc_begin++;
    }
    return {id, header.substr(desc_begin)};
}

FastaReader::FastaReader(std::istream& in, std::string source_name)
    : in_(in), source_name_(std::move(source_name)) {}

types::SequenceRecord FastaReader::make_record(const std::string& header_line,
                                               std::string sequence) const {
    auto parts = split_header(header_line.substr(1));
    if (parts.first.empty()) {
        throw errors::FormatError(source_name_, "FASTA header without an identifier: '" +
                                                    header_line + "'");
    }
    return types::SequenceRecord(std::move(parts.first), std::move(sequence),
                                 std::move(parts.second));
}

std::optional<types::SequenceRecord> FastaReader::next() {
    std::string line;

    if (!started_) {
        started_ = true;
        while (std::getline(in_, line)) {
            strip_cr(line);
            if (!is_blank(line)) break;
        }
        if (line.empty() || line[0] != '>') {
            throw errors::messages::not_a_fasta_file(source_name_);
        }
        pending_header_ = line;
    }

    if (!pending_header_) {
        return std::nullopt;
    }

    std::string header = std::move(*pending_header_);
    pending_header_.reset();
    std::string sequence;

    while (std::getline(in_, line)) {
        strip_cr(line);
        if (!line.empty() && line[0] == '>') {
            pending_header_ = line;
            break;
        }
        for (char c : line) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                sequence += c;
            }
        }
    }

    return make_record(header, std::move(sequence));
}

std::vector<types::SequenceRecord> FastaReader::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw errors::messages::file_not_found(path, "Input file");
    }

    FastaReader reader(file, path);
    std::vector<types::SequenceRecord> records;
    while (auto record = reader.next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

}  // namespace io
}  // namespace tootbert
