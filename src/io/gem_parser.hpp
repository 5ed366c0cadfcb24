#pragma once
#include <cstdint>
#include <string>
#include "common/errors.hpp"
#include "common/types.hpp"
#include "io/line_source.hpp"

namespace gem2bgef {

    // Parse one data row (already stripped of '\n'). On failure returns false
    // and sets `reason`; `rec` is then unspecified.
    bool parse_gem_line(const std::string& line, bool has_exon, GemRecord& rec, std::string& reason);

    // Apply one "#key=value" line to the header. Unknown keys are ignored.
    // Throws InputError on a malformed numeric value.
    void apply_metadata_line(const std::string& line, GemHeader& hdr);

    // Validate the column header row; sets hdr.has_exon. Throws InputError.
    void parse_column_header(const std::string& line, GemHeader& hdr);

    // Turns a line source into GEM records. Single forward pass.
    //
    //   GemParser p(src);
    //   const GemHeader& h = p.read_header();
    //   GemRecord rec; LineError err;
    //   while (true) {
    //       auto st = p.next(rec, err);
    //       if (st == GemParser::Status::End) break;
    //       ...
    //   }
    class GemParser {
    public:
        enum class Status { Record, Error, End };

        explicit GemParser(LineSource& src) : src_(src) {}

        // Consume metadata lines and the column header. Idempotent.
        // Throws InputError if the stream ends before a header or the header is invalid.
        const GemHeader& read_header();

        // Next record or recoverable line error. Reads the header first if needed.
        Status next(GemRecord& rec, LineError& err);

        const GemHeader& header() const { return hdr_; }
        uint64_t lines_read() const { return line_no_; }

    private:
        bool readline(std::string& line);

        LineSource& src_;
        GemHeader hdr_;
        bool header_done_ = false;
        uint64_t line_no_ = 0;
        std::string line_;
    };

} // namespace gem2bgef
