#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace gem2bgef {

	// Inclusive rectangle on raw GEM coordinates.
	struct Region {
		bool    enabled = false;
		int64_t min_x = 0;
		int64_t max_x = 0;
		int64_t min_y = 0;
		int64_t max_y = 0;

		bool contains(int64_t x, int64_t y) const {
			return x >= min_x && x <= max_x && y >= min_y && y <= max_y;
		}
	};

	struct ConvertConfig {
		// I/O
		std::string input_path;           // GEM or GEM.gz
		std::string output_path;          // bGEF (HDF5)

		// Aggregation
		std::vector<uint32_t> bin_sizes = { 1, 20, 50, 100 };
		Region region;                    // optional crop before binning

		// Top-level attributes
		uint32_t resolution = 1;          // opaque pass-through
		std::string omics;                // empty -> take #Omics from the GEM header

		// Bad-row policy
		uint32_t max_consecutive_errors = 0;  // 0 = never abort, skip and count
		uint32_t error_sample_limit = 5;      // offending lines kept for the summary

		// Logging
		uint64_t progress_interval = 4000000; // records between progress lines, 0 = off
		bool verbose = false;
	};

	// Load from a JSON file on disk. Keys absent from the file keep their defaults.
	// Throws ConfigError.
	ConvertConfig load_convert_config(const std::string& json_path);

	// Merge JSON text over `cfg` (used by load_convert_config).
	void apply_convert_config_json(const std::string& json_text, ConvertConfig& cfg);

	// "1,20,50" -> {1,20,50}. Throws ConfigError on empty items, non-integers,
	// values <= 0 or above the 32-bit range.
	std::vector<uint32_t> parse_bin_list(const std::string& s);

	// "minx,maxx,miny,maxy" -> enabled Region. Throws ConfigError.
	Region parse_region(const std::string& s);

	// Fatal checks before any processing: bin list non-empty, positive, unique;
	// region ordered; input/output set and distinct. Throws ConfigError.
	void validate_convert_config(const ConvertConfig& cfg);

} // namespace gem2bgef
