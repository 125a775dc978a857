#pragma once

#include "tootbert/errors/messages.h"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Header-only safetensors reader.
 *
 * File layout:
 *
 *   u64 LE  header length N
 *   N bytes JSON: { "__metadata__": {str: str},
 *                   "<tensor>": {"dtype": "F32", "shape": [..], "data_offsets": [b, e]}, ... }
 *   rest    tensor bytes, offsets relative to the start of this section
 *
 * Hugging Face exports of ProtBert store F32; F16 and BF16 checkpoints are
 * widened to float on load. Other dtypes are listed but cannot be loaded.
 */

namespace tootbert {
namespace weights {

struct TensorInfo {
    std::string dtype;
    std::vector<size_t> shape;
    size_t data_begin = 0;
    size_t data_end = 0;

    size_t num_elements() const {
        size_t n = 1;
        for (size_t d : shape) n *= d;
        return n;
    }

    size_t num_bytes() const { return data_end - data_begin; }

    /// "[1024, 4096]"
    std::string shape_string() const {
        std::string out = "[";
        for (size_t i = 0; i < shape.size(); ++i) {
            out += (i ? ", " : "") + std::to_string(shape[i]);
        }
        return out + "]";
    }
};

inline size_t dtype_size(const std::string& dtype) {
    if (dtype == "F32") return 4;
    if (dtype == "F16" || dtype == "BF16") return 2;
    return 0;
}

inline float bits_to_float(uint32_t bits) {
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

/// IEEE 754 binary16 to float, including subnormals, inf and NaN.
inline float half_to_float(uint16_t h) {
    const uint32_t sign = static_cast<uint32_t>(h >> 15) << 31;
    const int exponent = (h >> 10) & 0x1f;
    uint32_t mantissa = h & 0x3ffu;

    if (exponent == 0x1f) {
        return bits_to_float(sign | 0x7f800000u | (mantissa << 13));
    }
    if (exponent != 0) {
        return bits_to_float(sign | (static_cast<uint32_t>(exponent + 112) << 23) | (mantissa << 13));
    }
    if (mantissa == 0) {
        return bits_to_float(sign);
    }
    // subnormal: shift the leading one into the implicit bit
    int e = 113;
    while ((mantissa & 0x400u) == 0) {
        mantissa <<= 1;
        --e;
    }
    return bits_to_float(sign | (static_cast<uint32_t>(e) << 23) | ((mantissa & 0x3ffu) << 13));
}

/// bfloat16 is the upper half of a float.
inline float bfloat16_to_float(uint16_t b) {
    return bits_to_float(static_cast<uint32_t>(b) << 16);
}

/**
 * Reads the JSON subset a safetensors header uses: objects with string
 * keys whose values are strings, arrays of non-negative integers or
 * further objects. Throws std::runtime_error with the byte offset on
 * anything else.
 */
class HeaderParser {
public:
    struct Header {
        std::map<std::string, TensorInfo> tensors;
        std::map<std::string, std::string> metadata;
    };

    static Header parse(const std::string& json) {
        HeaderParser p(json);
        Header header;
        p.object([&](const std::string& key) {
            if (key == "__metadata__") {
                p.object([&](const std::string& meta_key) { header.metadata[meta_key] = p.string(); });
            } else {
                header.tensors[key] = p.tensor();
            }
        });
        p.skip_space();
        if (p.pos_ != p.text_.size()) p.fail("trailing characters after header");
        return header;
    }

private:
    explicit HeaderParser(const std::string& text) : text_(text) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error(what + " at offset " + std::to_string(pos_));
    }

    void skip_space() {
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
            ++pos_;
        }
    }

    char peek() {
        skip_space();
        if (pos_ >= text_.size()) fail("unexpected end of header");
        return text_[pos_];
    }

    void consume(char c) {
        if (peek() != c) fail(std::string("expected '") + c + "'");
        ++pos_;
    }

    // Comma separated members until the closing brace
    void object(const std::function<void(const std::string&)>& member) {
        consume('{');
        if (peek() == '}') {
            ++pos_;
            return;
        }
        for (;;) {
            const std::string key = string();
            consume(':');
            member(key);
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            consume('}');
            return;
        }
    }

    std::string string() {
        consume('"');
        std::string out;
        while (pos_ < text_.size() && text_[pos_] != '"') {
            if (text_[pos_] == '\\' && pos_ + 1 < text_.size()) ++pos_;
            out += text_[pos_++];
        }
        if (pos_ >= text_.size()) fail("unterminated string");
        ++pos_;
        return out;
    }

    size_t integer() {
        skip_space();
        const size_t start = pos_;
        size_t value = 0;
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
            value = value * 10 + static_cast<size_t>(text_[pos_++] - '0');
        }
        if (pos_ == start) fail("expected a non-negative integer");
        return value;
    }

    std::vector<size_t> integers() {
        std::vector<size_t> out;
        consume('[');
        if (peek() == ']') {
            ++pos_;
            return out;
        }
        for (;;) {
            out.push_back(integer());
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            consume(']');
            return out;
        }
    }

    TensorInfo tensor() {
        TensorInfo info;
        bool has_offsets = false;
        object([&](const std::string& field) {
            if (field == "dtype") {
                info.dtype = string();
            } else if (field == "shape") {
                info.shape = integers();
            } else if (field == "data_offsets") {
                const auto offsets = integers();
                if (offsets.size() != 2 || offsets[1] < offsets[0]) {
                    fail("data_offsets must be [begin, end]");
                }
                info.data_begin = offsets[0];
                info.data_end = offsets[1];
                has_offsets = true;
            } else {
                fail("unexpected tensor field '" + field + "'");
            }
        });
        if (info.dtype.empty() || !has_offsets) fail("tensor entry without dtype or data_offsets");
        return info;
    }

    const std::string& text_;
    size_t pos_ = 0;
};

/**
 * Tensors and metadata of one safetensors file or in-memory image.
 *
 *   SafetensorsLoader st("model.safetensors");
 *   auto q = st.load_tensor("encoder.layer.0.attention.self.query.weight");
 *   auto heads = st.metadata_value("num_attention_heads");
 *
 * The header is parsed on construction; tensor bytes are read on demand.
 */
class SafetensorsLoader {
public:
    /**
     * @throws FileNotFoundError if the file cannot be opened
     * @throws FormatError if the header is malformed or points past the data
     */
    explicit SafetensorsLoader(const std::string& filepath) : path_(filepath) {
        std::ifstream in(path_, std::ios::binary | std::ios::ate);
        if (!in) {
            throw errors::messages::file_not_found(path_, "Safetensors file");
        }
        const auto file_size = static_cast<uint64_t>(in.tellg());
        in.seekg(0);

        char prefix[8];
        if (file_size < 8 || !in.read(prefix, 8)) {
            throw errors::messages::invalid_safetensors(path_, "file shorter than 8 bytes");
        }
        header_len_ = read_header_length(prefix, file_size);

        std::string json(header_len_, '\0');
        if (!in.read(&json[0], static_cast<std::streamsize>(header_len_))) {
            throw errors::messages::invalid_safetensors(path_, "truncated header");
        }
        index(json, file_size - 8 - header_len_);
    }

    /**
     * Reads from memory that must outlive the loader.
     */
    SafetensorsLoader(const uint8_t* data, size_t size) : path_("<buffer>"), memory_(data) {
        if (size < 8) {
            throw errors::messages::invalid_safetensors(path_, "buffer shorter than 8 bytes");
        }
        header_len_ = read_header_length(reinterpret_cast<const char*>(data), size);
        index(std::string(reinterpret_cast<const char*>(data) + 8, header_len_),
              size - 8 - header_len_);
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> names;
        names.reserve(tensors_.size());
        for (const auto& entry : tensors_) names.push_back(entry.first);
        return names;
    }

    bool has_tensor(const std::string& name) const { return tensors_.count(name) != 0; }

    /// @throws FormatError if there is no tensor called `name`
    const TensorInfo& get_info(const std::string& name) const {
        const auto it = tensors_.find(name);
        if (it == tensors_.end()) {
            throw errors::messages::invalid_safetensors(path_, "tensor not found: " + name);
        }
        return it->second;
    }

    const std::map<std::string, std::string>& metadata() const { return metadata_; }

    /// "" when the key is absent.
    std::string metadata_value(const std::string& key) const {
        const auto it = metadata_.find(key);
        return it != metadata_.end() ? it->second : std::string();
    }

    const std::string& path() const { return path_; }

    /**
     * The tensor's values as float32, row-major.
     *
     * @throws FormatError for a dtype other than F32/F16/BF16, or when the
     *         byte range does not match the shape
     */
    std::vector<float> load_tensor(const std::string& name) const {
        const TensorInfo& info = get_info(name);
        const size_t width = dtype_size(info.dtype);
        if (width == 0) {
            throw errors::messages::invalid_safetensors(
                path_, "unsupported dtype " + info.dtype + " for " + name);
        }
        if (info.num_bytes() != info.num_elements() * width) {
            throw errors::messages::invalid_safetensors(
                path_, "byte range of " + name + " does not match shape " + info.shape_string());
        }

        const std::vector<uint8_t> bytes = read_range(info);
        std::vector<float> values(info.num_elements());
        if (width == 4) {
            std::memcpy(values.data(), bytes.data(), bytes.size());
            return values;
        }

        float (*widen)(uint16_t) = info.dtype == "BF16" ? bfloat16_to_float : half_to_float;
        for (size_t i = 0; i < values.size(); ++i) {
            uint16_t raw;
            std::memcpy(&raw, &bytes[2 * i], sizeof(raw));
            values[i] = widen(raw);
        }
        return values;
    }

private:
    // Real headers are a few hundred KB at most
    static constexpr uint64_t kMaxHeaderLength = 100ull << 20;

    uint64_t read_header_length(const char* prefix, uint64_t total_size) const {
        uint64_t n = 0;
        for (int i = 7; i >= 0; --i) {
            n = (n << 8) | static_cast<uint8_t>(prefix[i]);
        }
        if (n > kMaxHeaderLength) {
            throw errors::messages::invalid_safetensors(path_,
                                                        "header size too large: " + std::to_string(n));
        }
        if (8 + n > total_size) {
            throw errors::messages::invalid_safetensors(path_, "truncated header");
        }
        return n;
    }

    void index(const std::string& json, uint64_t data_size) {
        HeaderParser::Header header;
        try {
            header = HeaderParser::parse(json);
        } catch (const std::runtime_error& e) {
            throw errors::messages::invalid_safetensors(path_, e.what());
        }
        for (const auto& entry : header.tensors) {
            if (entry.second.data_end > data_size) {
                throw errors::messages::invalid_safetensors(
                    path_, "tensor " + entry.first + " extends past end of data");
            }
        }
        tensors_ = std::move(header.tensors);
        metadata_ = std::move(header.metadata);
    }

    std::vector<uint8_t> read_range(const TensorInfo& info) const {
        std::vector<uint8_t> bytes(info.num_bytes());
        const uint64_t offset = 8 + header_len_ + info.data_begin;
        if (memory_ != nullptr) {
            std::memcpy(bytes.data(), memory_ + offset, bytes.size());
            return bytes;
        }

        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            throw errors::messages::file_not_found(path_, "Safetensors file");
        }
        in.seekg(static_cast<std::streamoff>(offset));
        if (!in.read(reinterpret_cast<char*>(bytes.data()),
                     static_cast<std::streamsize>(bytes.size()))) {
            throw errors::messages::invalid_safetensors(path_, "failed to read tensor data");
        }
        return bytes;
    }

    std::string path_;
    const uint8_t* memory_ = nullptr;
    uint64_t header_len_ = 0;
    std::map<std::string, TensorInfo> tensors_;
    std::map<std::string, std::string> metadata_;
};

}  // namespace weights
}  // namespace tootbert
