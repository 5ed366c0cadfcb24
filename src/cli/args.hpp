#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include "config/convert_config.hpp"

#ifndef GEM2BGEF_VERSION
#define GEM2BGEF_VERSION "0.1.0"
#endif

namespace gem2bgef {
namespace cli {

	// Thrown by parse_args to end the program: code 0 after -h/-V,
	// code 1 with a message for usage errors.
	class ParseArgsExit : public std::runtime_error {
	public:
		explicit ParseArgsExit(int code, const std::string& msg = "")
			: std::runtime_error(msg), code_(code) {}
		int code() const { return code_; }
	private:
		int code_;
	};

	// Raw command line. Unset optionals leave the config file / default value alone.
	struct Options {
		std::string config_file;
		std::optional<std::string> input_file;
		std::optional<std::string> output_file;
		std::optional<std::string> bin_list;
		std::optional<std::string> region;
		std::optional<std::string> omics;
		std::optional<uint32_t> resolution;
		std::optional<uint32_t> max_errors;
		bool verbose = false;
	};

	void print_version();
	void print_usage(const char* program_name);

	// Throws ParseArgsExit.
	Options parse_args(int argc, char* argv[]);

	// Config file first (if any), then command-line overrides. The result is
	// not validated. Throws ConfigError.
	ConvertConfig build_config(const Options& opts);

} // namespace cli
} // namespace gem2bgef
