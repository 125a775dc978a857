/**
 * Unit tests for the command-line parser.
 *
 * Builds an app shaped like the tootbert executable (global flags, a
 * classify subcommand with positionals and dual-spelling options).
 */

#include "tootbert/cli/cli.h"
#include "../../test_utils.h"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace tootbert::cli;
using tootbert::test::TempDir;
using tootbert::test::write_text;

namespace {

struct Parsed {
    bool quiet = false;
    bool progress = false;
    std::string input;
    std::string output;
    std::string lr_model = "lr_model.safetensors";
    int max_seq_len = 20000;
    std::string device = "auto";
};

class Harness {
public:
    Harness() : app("tootbert", "test app") {
        app.require_subcommand(true);
        app.add_flag("--quiet", p.quiet, "quiet");
        app.add_flag("--progress", p.progress, "progress");

        classify = app.add_subcommand("classify", "Classify FASTA sequences");
        classify->add_positional("input_file", p.input, "Input FASTA file")->check(ExistingFile());
        classify->add_positional("output_file", p.output, "Output results file");
        classify->add_option("--lr-model,-lr_model", p.lr_model, "classifier");
        classify->add_option("--max-seq-len,-max_seq_len", p.max_seq_len, "limit")
            ->check(Range(2, 1 << 20));
        classify->add_option("--device", p.device, "device")
            ->check(IsMember({"auto", "cpu", "cuda", "mps"}));
    }

    // Returns the exit code app.exit() would produce, or -1 on success
    int parse(const std::vector<std::string>& args) {
        try {
            app.parse(args);
        } catch (const Error& e) {
            std::ostringstream out, err;
            int code = app.exit(e, out, err);
            last_out = out.str();
            last_err = err.str();
            return code;
        }
        return -1;
    }

    Parsed p;
    App app;
    App* classify;
    std::string last_out;
    std::string last_err;
};

}  // namespace

bool test_positionals_and_defaults() {
    std::cout << "=== Test 1: Positionals and defaults ===" << std::endl;

    TempDir dir;
    write_text(dir.file("in.fa"), ">a\nMKV\n");

    Harness h;
    int code = h.parse({"classify", dir.file("in.fa"), "out.txt"});

    bool ok = code == -1 && h.app.get_active_subcommand() == h.classify;
    ok &= h.p.input == dir.file("in.fa") && h.p.output == "out.txt";
    ok &= h.p.max_seq_len == 20000 && h.p.lr_model == "lr_model.safetensors";
    ok &= !h.p.quiet && !h.p.progress;

    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_option_spellings() {
    std::cout << "=== Test 2: Long, single-dash and '=' spellings ===" << std::endl;

    TempDir dir;
    write_text(dir.file("in.fa"), ">a\nMKV\n");
    const std::string in = dir.file("in.fa");

    Harness a;
    bool ok = a.parse({"classify", in, "o", "-max_seq_len", "512", "-lr_model", "m.st"}) == -1;
    ok &= a.p.max_seq_len == 512 && a.p.lr_model == "m.st";

    Harness b;
    ok &= b.parse({"classify", "--max-seq-len=1024", in, "o", "--lr-model=x"}) == -1;
    ok &= b.p.max_seq_len == 1024 && b.p.lr_model == "x";

    // Global flags before or after the subcommand
    Harness c;
    ok &= c.parse({"--quiet", "classify", in, "o", "--progress"}) == -1;
    ok &= c.p.quiet && c.p.progress;

    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_errors() {
    std::cout << "=== Test 3: Parse errors exit with 2 ===" << std::endl;

    TempDir dir;
    write_text(dir.file("in.fa"), ">a\nMKV\n");
    const std::string in = dir.file("in.fa");

    bool ok = true;

    Harness missing;
    ok &= missing.parse({"classify", in}) == 2;
    ok &= missing.last_err.find("output_file") != std::string::npos;

    Harness unknown;
    ok &= unknown.parse({"classify", in, "o", "--bogus"}) == 2;
    ok &= unknown.last_err.find("Unknown option: --bogus") != std::string::npos;

    Harness no_file;
    ok &= no_file.parse({"classify", dir.file("absent.fa"), "o"}) == 2;

    Harness range;
    ok &= range.parse({"classify", in, "o", "--max-seq-len", "1"}) == 2;

    Harness not_int;
    ok &= not_int.parse({"classify", in, "o", "--max-seq-len", "many"}) == 2;

    Harness device;
    ok &= device.parse({"classify", in, "o", "--device", "tpu"}) == 2;

    Harness no_value;
    ok &= no_value.parse({"classify", in, "o", "--lr-model"}) == 2;

    Harness no_sub;
    ok &= no_sub.parse({"--quiet"}) == 2;

    Harness extra;
    ok &= extra.parse({"classify", in, "o", "third"}) == 2;

    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_help() {
    std::cout << "=== Test 4: --help prints usage and exits 0 ===" << std::endl;

    Harness top;
    bool ok = top.parse({"--help"}) == 0;
    ok &= top.last_out.find("classify") != std::string::npos;
    ok &= top.last_err.empty();

    Harness sub;
    ok &= sub.parse({"classify", "-h"}) == 0;
    ok &= sub.last_out.find("input_file") != std::string::npos;
    ok &= sub.last_out.find("--max-seq-len") != std::string::npos;

    std::cout << sub.last_out << std::endl;

    if (!ok) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  CLI Parser Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    int passed = 0;
    int total = 4;

    if (test_positionals_and_defaults()) passed++;
    if (test_option_spellings()) passed++;
    if (test_errors()) passed++;
    if (test_help()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
