#include "core/conversion.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include "common/log.hpp"
#include "core/bin_aggregator.hpp"
#include "io/bgef_assembler.hpp"
#include "io/gem_parser.hpp"

namespace gem2bgef {

    void ConversionRun::on_line_error(LineError&& err, uint32_t& consecutive) {
        ++summary_.line_errors;
        ++consecutive;
        const uint64_t line_no = err.line_no;
        if (cfg_.verbose) {
            log_warn("line " + std::to_string(err.line_no) + ": " + err.reason);
        }
        if (summary_.error_samples.size() < cfg_.error_sample_limit) {
            summary_.error_samples.push_back(std::move(err));
        }
        if (cfg_.max_consecutive_errors > 0 && consecutive >= cfg_.max_consecutive_errors) {
            throw InputError(std::to_string(consecutive) + " consecutive malformed lines (last at line "
                + std::to_string(line_no) + ")");
        }
    }

    BgefDocument ConversionRun::run(LineSource& src) {
        summary_ = ConversionSummary();

        BgefDocument doc;
        doc.resolution = cfg_.resolution;
        doc.bin_sizes = cfg_.bin_sizes;

        GemParser parser(src);
        doc.header = parser.read_header();
        doc.omics = cfg_.omics.empty() ? doc.header.omics : cfg_.omics;

        log_msg("Reading " + src.name() + " (sample " + doc.header.sample_id
            + (doc.header.has_exon ? ", with ExonCount" : "") + ")");

        // Aggregators keep a reference to doc.genes; doc is not moved until they finish.
        std::vector<std::unique_ptr<BinAggregator>> aggs;
        aggs.reserve(cfg_.bin_sizes.size());
        for (uint32_t b : cfg_.bin_sizes) {
            aggs.push_back(std::make_unique<BinAggregator>(b, doc.genes));
        }

        GemRecord rec;
        LineError err;
        uint32_t consecutive = 0;
        while (true) {
            GemParser::Status st = parser.next(rec, err);
            if (st == GemParser::Status::End) break;
            summary_.lines_read = parser.lines_read();

            if (st == GemParser::Status::Error) {
                on_line_error(std::move(err), consecutive);
                err = LineError();
                continue;
            }
            consecutive = 0;

            if (cfg_.region.enabled && !cfg_.region.contains(rec.x, rec.y)) {
                ++summary_.filtered_out;
                continue;
            }

            for (auto& a : aggs) a->consume(rec);
            ++summary_.records;

            if (cfg_.progress_interval > 0 && summary_.records % cfg_.progress_interval == 0) {
                log_msg("  " + std::to_string(summary_.records) + " records, "
                    + std::to_string(doc.genes.size()) + " genes");
            }
        }
        summary_.lines_read = parser.lines_read();

        if (summary_.records == 0) {
            throw InputError("no valid records in " + src.name() + " ("
                + std::to_string(summary_.line_errors) + " malformed, "
                + std::to_string(summary_.filtered_out) + " outside region)");
        }

        doc.genes.freeze();
        summary_.genes = doc.genes.size();

        doc.results.reserve(aggs.size());
        for (auto& a : aggs) {
            doc.results.push_back(a->finish());
        }
        aggs.clear();

        return doc;
    }

    void log_summary(const ConversionSummary& s) {
        log_msg("Lines read: " + std::to_string(s.lines_read)
            + " | records: " + std::to_string(s.records)
            + " | genes: " + std::to_string(s.genes));
        if (s.filtered_out > 0) {
            log_msg("Outside region: " + std::to_string(s.filtered_out));
        }
        if (s.line_errors > 0) {
            log_warn("Skipped " + std::to_string(s.line_errors) + " malformed lines");
            for (const auto& e : s.error_samples) {
                log_warn("  line " + std::to_string(e.line_no) + " (" + e.reason + "): " + e.raw);
            }
        }
    }

    ConversionSummary convert(const ConvertConfig& cfg) {
        validate_convert_config(cfg);
        const auto t0 = std::chrono::steady_clock::now();

        GzLineSource src(cfg.input_path);
        ConversionRun run(cfg);
        BgefDocument doc = run.run(src);
        log_msg("Parsed in " + format_elapsed(t0));

        const auto t1 = std::chrono::steady_clock::now();
        BgefAssembler(doc).write(cfg.output_path);
        log_msg("Wrote " + cfg.output_path + " in " + format_elapsed(t1));

        log_summary(run.summary());
        log_msg("Total " + format_elapsed(t0));
        return run.summary();
    }

} // namespace gem2bgef
