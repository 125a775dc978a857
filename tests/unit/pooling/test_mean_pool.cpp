/**
 * Unit tests for mean pooling over residue positions.
 */

#include "tootbert/pooling/mean_pool.h"
#include "../../test_utils.h"
#include <iostream>
#include <vector>

using namespace tootbert;
using test::close;
using test::throws_as;

namespace {

// Row r holds r * 10 + d
types::EmbeddingMatrix ramp(int rows, int dim) {
    types::EmbeddingMatrix m(rows, dim);
    for (int r = 0; r < rows; r++) {
        for (int d = 0; d < dim; d++) {
            m.row(r)[d] = static_cast<float>(r * 10 + d);
        }
    }
    return m;
}

}  // namespace

bool test_boundaries_excluded() {
    std::cout << "=== Test 1: [CLS] and [SEP] rows are dropped ===" << std::endl;

    // [CLS] M K V [SEP]
    auto emb = ramp(5, 3);
    auto f = pooling::pool(emb, {1, 1, 1, 1, 1});

    // Mean of rows 1, 2, 3 -> 20 + d
    bool ok = f.size() == 3 && close(f[0], 20.0f) && close(f[1], 21.0f) && close(f[2], 22.0f);
    if (!ok) {
        std::cout << "✗ FAIL: [" << f[0] << ", " << f[1] << ", " << f[2] << "]" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_padding_ignored() {
    std::cout << "=== Test 2: Padding rows never contribute ===" << std::endl;

    // [CLS] A B [SEP] PAD PAD
    auto emb = ramp(6, 2);
    for (int d = 0; d < 2; d++) {
        emb.row(4)[d] = 1.0e6f;
        emb.row(5)[d] = -1.0e6f;
    }
    auto f = pooling::pool(emb, {1, 1, 1, 1, 0, 0});

    // Rows 1 and 2 -> 15 + d
    bool ok = close(f[0], 15.0f) && close(f[1], 16.0f);
    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_single_residue() {
    std::cout << "=== Test 3: One residue pools to its own row ===" << std::endl;

    auto emb = ramp(3, 4);
    auto f = pooling::pool(emb, {1, 1, 1});

    bool ok = true;
    for (int d = 0; d < 4; d++) ok &= close(f[d], emb.row(1)[d]);
    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_empty_and_mismatch() {
    std::cout << "=== Test 4: Nothing between the boundaries ===" << std::endl;

    bool ok = true;
    ok &= throws_as<errors::EmptySequenceError>([] { pooling::pool(ramp(2, 4), {1, 1}); });
    ok &= throws_as<errors::EmptySequenceError>([] { pooling::pool(ramp(4, 4), {1, 1, 0, 0}); });
    ok &= throws_as<errors::EmptySequenceError>([] { pooling::pool(ramp(0, 4), {}); });
    ok &= throws_as<errors::InferenceError>([] { pooling::pool(ramp(4, 4), {1, 1, 1}); });

    try {
        pooling::pool(ramp(2, 4), {1, 1});
    } catch (const errors::EmptySequenceError& e) {
        std::cout << "  message: " << e.what() << std::endl;
        ok &= e.category() == errors::ErrorCategory::Pooling;
    }

    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Mean Pooling Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    int passed = 0;
    int total = 4;

    if (test_boundaries_excluded()) passed++;
    if (test_padding_ignored()) passed++;
    if (test_single_residue()) passed++;
    if (test_empty_and_mismatch()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
