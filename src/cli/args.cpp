#include "cli/args.hpp"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>
#include "common/errors.hpp"

namespace gem2bgef {
namespace cli {

    void print_version() {
        std::cout << "gem2bgef " << GEM2BGEF_VERSION << "\n";
    }

    void print_usage(const char* program_name) {
        std::cout << "gem2bgef v" << GEM2BGEF_VERSION << "\n\n";
        std::cout << "Usage: " << program_name << " -i <input> -o <output> [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -i, --input <file>       Input GEM file (plain or .gz)\n";
        std::cout << "  -o, --output <file>      Output bGEF file\n";
        std::cout << "  -b, --bin-sizes <list>   Comma-separated bin sizes (default: 1,20,50,100)\n";
        std::cout << "  -r, --resolution <int>   Resolution attribute (default: 1)\n";
        std::cout << "  -c, --config <file>      JSON config; command-line flags override it\n";
        std::cout << "  --region <x0,x1,y0,y1>   Keep records inside this inclusive rectangle\n";
        std::cout << "  --omics <name>           Omics label (default: #Omics header or Transcriptomics)\n";
        std::cout << "  --max-errors <int>       Abort after this many consecutive bad lines (0 = never)\n";
        std::cout << "\n";
        std::cout << "  -v, --verbose            Log every skipped line\n";
        std::cout << "  -V, --version            Show version and exit\n";
        std::cout << "  -h, --help               Show this help message\n";
        std::cout << "\n";
        std::cout << "Examples:\n";
        std::cout << "  " << program_name << " -i sample.gem.gz -o sample.bgef\n";
        std::cout << "  " << program_name << " -i sample.gem -o sample.bgef -b 1,50,200 --region 0,9999,0,9999\n";
    }

    Options parse_args(int argc, char* argv[]) {
        Options opts;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            auto require_value = [&](const std::string& flag) -> std::string {
                if (i + 1 >= argc) {
                    throw ParseArgsExit(1, "Error: Missing value for " + flag);
                }
                return argv[++i];
            };

            auto parse_u32 = [&](const std::string& flag, const std::string& value) -> uint32_t {
                if (value.empty() || value[0] == '-' || value[0] == '+') {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                errno = 0;
                char* end = nullptr;
                unsigned long long v = std::strtoull(value.c_str(), &end, 10);
                if (errno != 0 || *end != '\0' || v > std::numeric_limits<uint32_t>::max()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return (uint32_t)v;
            };

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                throw ParseArgsExit(0);
            } else if (arg == "-V" || arg == "--version") {
                print_version();
                throw ParseArgsExit(0);
            } else if (arg == "-i" || arg == "--input") {
                opts.input_file = require_value(arg);
            } else if (arg == "-o" || arg == "--output") {
                opts.output_file = require_value(arg);
            } else if (arg == "-b" || arg == "--bin-sizes") {
                opts.bin_list = require_value(arg);
            } else if (arg == "-r" || arg == "--resolution") {
                opts.resolution = parse_u32(arg, require_value(arg));
            } else if (arg == "-c" || arg == "--config") {
                opts.config_file = require_value(arg);
            } else if (arg == "--region") {
                opts.region = require_value(arg);
            } else if (arg == "--omics") {
                opts.omics = require_value(arg);
                if (opts.omics->empty()) {
                    throw ParseArgsExit(1, "Error: --omics must not be empty");
                }
            } else if (arg == "--max-errors") {
                opts.max_errors = parse_u32(arg, require_value(arg));
            } else if (arg == "-v" || arg == "--verbose") {
                opts.verbose = true;
            } else {
                throw ParseArgsExit(1, "Error: Unknown option: " + arg);
            }
        }

        if (opts.config_file.empty()) {
            if (!opts.input_file) throw ParseArgsExit(1, "Error: No input file specified");
            if (!opts.output_file) throw ParseArgsExit(1, "Error: No output file specified");
        }

        return opts;
    }

    ConvertConfig build_config(const Options& opts) {
        ConvertConfig cfg;
        if (!opts.config_file.empty()) cfg = load_convert_config(opts.config_file);

        if (opts.input_file) cfg.input_path = *opts.input_file;
        if (opts.output_file) cfg.output_path = *opts.output_file;
        if (opts.bin_list) cfg.bin_sizes = parse_bin_list(*opts.bin_list);
        if (opts.region) cfg.region = parse_region(*opts.region);
        if (opts.omics) cfg.omics = *opts.omics;
        if (opts.resolution) cfg.resolution = *opts.resolution;
        if (opts.max_errors) cfg.max_consecutive_errors = *opts.max_errors;
        if (opts.verbose) cfg.verbose = true;

        return cfg;
    }

} // namespace cli
} // namespace gem2bgef
