/**
 * .npy writer for pooled feature matrices.
 *
 * float32, C-order, format version 1.0.
 */

#pragma once

#include "tootbert/errors/messages.h"
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace tootbert {
namespace io {

namespace detail {

inline void write_npy_header(std::ofstream& file, const std::string& shape) {
    file.write("\x93NUMPY", 6);
    file.write("\x01\x00", 2);

    std::string header = "{'descr': '<f4', 'fortran_order': False, 'shape': " + shape + ", }";

    // Pad so that magic + version + length + header is a multiple of 64
    size_t padding = (64 - (10 + header.size() + 1) % 64) % 64;
    header.append(padding, ' ');
    header += '\n';

    uint16_t header_len = static_cast<uint16_t>(header.size());
    file.write(reinterpret_cast<const char*>(&header_len), 2);
    file.write(header.data(), static_cast<std::streamsize>(header.size()));
}

}  // namespace detail

/**
 * Save a row-major [rows x cols] matrix.
 *
 * @throws FileWriteError
 */
inline void save_npy_2d(const std::string& filepath, const float* data, int rows, int cols) {
    std::ofstream file(filepath, std::ios::binary);
    if (!file) {
        throw errors::messages::file_write_error(filepath, "cannot open .npy file");
    }

    std::ostringstream shape;
    shape << "(" << rows << ", " << cols << ")";
    detail::write_npy_header(file, shape.str());

    file.write(reinterpret_cast<const char*>(data),
               static_cast<std::streamsize>(static_cast<size_t>(rows) * cols * sizeof(float)));
    if (!file) {
        throw errors::messages::file_write_error(filepath, "write failed");
    }
}

/**
 * Save feature rows of equal width as one [N x D] matrix.
 *
 * An empty list writes shape (0, dim).
 *
 * @throws DimensionError if rows differ in width
 * @throws FileWriteError
 */
inline void save_feature_matrix(const std::string& filepath,
                                const std::vector<std::vector<float>>& rows, int dim) {
    std::vector<float> flat;
    flat.reserve(rows.size() * static_cast<size_t>(dim));
    for (const auto& row : rows) {
        if (static_cast<int>(row.size()) != dim) {
            throw errors::DimensionError("feature row", std::to_string(row.size()),
                                         std::to_string(dim));
        }
        flat.insert(flat.end(), row.begin(), row.end());
    }
    save_npy_2d(filepath, flat.data(), static_cast<int>(rows.size()), dim);
}

}  // namespace io
}  // namespace tootbert
