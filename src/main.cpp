#include <iostream>
#include <string>
#include "cli/args.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "core/conversion.hpp"

using gem2bgef::ConvertConfig;
using gem2bgef::ConversionSummary;

// Exit codes: 0 ok, 1 usage/config, 2 input, 3 invariant, 4 assembly/I-O.
int main(int argc, char** argv) {
    gem2bgef::cli::Options opts;
    try {
        opts = gem2bgef::cli::parse_args(argc, argv);
    }
    catch (const gem2bgef::cli::ParseArgsExit& e) {
        if (e.code() != 0) {
            std::cerr << e.what() << "\n";
            std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        }
        return e.code();
    }

    try {
        ConvertConfig cfg = gem2bgef::cli::build_config(opts);
        std::cout << "Input: " << cfg.input_path << " | output: " << cfg.output_path
            << " | bins: " << cfg.bin_sizes.size() << "\n";

        ConversionSummary s = gem2bgef::convert(cfg);
        std::cout << "Converted " << s.records << " records, " << s.genes << " genes";
        if (s.line_errors > 0) std::cout << " (" << s.line_errors << " lines skipped)";
        std::cout << "\n";
    }
    catch (const gem2bgef::ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }
    catch (const gem2bgef::InputError& e) {
        std::cerr << "Input error: " << e.what() << "\n";
        return 2;
    }
    catch (const gem2bgef::InvariantError& e) {
        std::cerr << "Internal error: " << e.what() << "\n";
        return 3;
    }
    catch (const gem2bgef::AssemblyError& e) {
        std::cerr << "Output error: " << e.what() << "\n";
        return 4;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    return 0;
}
