#pragma once
#include <cstdint>
#include <vector>
#include "common/errors.hpp"
#include "config/convert_config.hpp"
#include "core/bgef_document.hpp"
#include "io/line_source.hpp"

namespace gem2bgef {

    struct ConversionSummary {
        uint64_t lines_read = 0;
        uint64_t records = 0;        // valid records passed to the aggregators
        uint64_t line_errors = 0;
        uint64_t filtered_out = 0;   // valid records outside the region
        uint32_t genes = 0;
        std::vector<LineError> error_samples;
    };

    // One forward pass over a GEM stream. Every accepted record is pushed to
    // all bin-size aggregators in the same iteration, so the input is read once
    // and nothing is buffered.
    class ConversionRun {
    public:
        // The config is not validated here; see validate_convert_config.
        explicit ConversionRun(const ConvertConfig& cfg) : cfg_(cfg) {}

        // Throws InputError (header, metadata, error threshold, no valid records)
        // or InvariantError.
        BgefDocument run(LineSource& src);

        const ConversionSummary& summary() const { return summary_; }

    private:
        void on_line_error(LineError&& err, uint32_t& consecutive);

        const ConvertConfig& cfg_;
        ConversionSummary summary_;
    };

    // Validate, open, run, assemble and commit. Returns the run summary.
    ConversionSummary convert(const ConvertConfig& cfg);

    void log_summary(const ConversionSummary& s);

} // namespace gem2bgef
