#include "io/gem_parser.hpp"

#include <charconv>
#include <limits>
#include <string_view>
#include <utility>
#include <vector>

namespace gem2bgef {

    // ============================ field helpers ============================

    static void split_tabs(std::string_view s, std::vector<std::string_view>& out) {
        out.clear();
        size_t start = 0;
        while (true) {
            size_t tab = s.find('\t', start);
            if (tab == std::string_view::npos) {
                out.push_back(s.substr(start));
                return;
            }
            out.push_back(s.substr(start, tab - start));
            start = tab + 1;
        }
    }

    static std::string_view trim(std::string_view s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
        return s;
    }

    // One leading '+' is accepted; from_chars alone rejects it.
    static std::string_view skip_plus(std::string_view s) {
        if (s.size() > 1 && s.front() == '+' && s[1] != '+' && s[1] != '-') s.remove_prefix(1);
        return s;
    }

    static bool parse_i64(std::string_view s, int64_t& v) {
        s = skip_plus(s);
        if (s.empty()) return false;
        auto res = std::from_chars(s.data(), s.data() + s.size(), v);
        return res.ec == std::errc() && res.ptr == s.data() + s.size();
    }

    // Unsigned 32-bit count. Distinguishes negative values for the error message.
    static bool parse_count(std::string_view s, uint32_t& v, const char* col, std::string& reason) {
        if (s.empty()) { reason = std::string("empty ") + col; return false; }
        s = skip_plus(s);
        if (s.front() == '-') {
            int64_t tmp = 0;
            if (parse_i64(s, tmp)) { reason = std::string("negative ") + col; return false; }
            reason = std::string("non-integer ") + col;
            return false;
        }
        auto res = std::from_chars(s.data(), s.data() + s.size(), v);
        if (res.ec == std::errc::result_out_of_range) {
            reason = std::string(col) + " out of 32-bit range";
            return false;
        }
        if (res.ec != std::errc() || res.ptr != s.data() + s.size()) {
            reason = std::string("non-integer ") + col;
            return false;
        }
        return true;
    }

    static std::string_view strip_cr(const std::string& line) {
        std::string_view s(line);
        if (!s.empty() && s.back() == '\r') s.remove_suffix(1);
        return s;
    }

    // ============================ public helpers ============================

    bool parse_gem_line(const std::string& line, bool has_exon, GemRecord& rec, std::string& reason) {
        thread_local std::vector<std::string_view> f;
        split_tabs(strip_cr(line), f);

        const size_t want = has_exon ? 5 : 4;
        if (f.size() != want) {
            reason = "expected " + std::to_string(want) + " columns, got " + std::to_string(f.size());
            return false;
        }
        if (f[0].empty()) { reason = "empty geneID"; return false; }

        if (!parse_i64(f[1], rec.x)) { reason = "non-integer x"; return false; }
        if (!parse_i64(f[2], rec.y)) { reason = "non-integer y"; return false; }
        if (!parse_count(f[3], rec.mid_count, "MIDCount", reason)) return false;

        rec.exon_count = 0;
        if (has_exon && !parse_count(f[4], rec.exon_count, "ExonCount", reason)) return false;

        rec.gene_id.assign(f[0].data(), f[0].size());
        return true;
    }

    static int64_t metadata_int(const std::string& key, std::string_view value) {
        int64_t v = 0;
        if (!parse_i64(value, v)) {
            throw InputError("Invalid integer in metadata #" + key + "=" + std::string(value));
        }
        return v;
    }

    void apply_metadata_line(const std::string& line, GemHeader& hdr) {
        std::string_view s = strip_cr(line);
        if (s.empty() || s.front() != '#') return;
        s.remove_prefix(1);

        const size_t eq = s.find('=');
        if (eq == std::string_view::npos) return;  // free-form comment
        const std::string key(trim(s.substr(0, eq)));
        const std::string_view value = trim(s.substr(eq + 1));

        if (key == "Stereo-seqChip" || key == "SampleID" || key == "sn") {
            if (!value.empty()) hdr.sample_id.assign(value.data(), value.size());
        }
        else if (key == "Omics") {
            if (!value.empty()) hdr.omics.assign(value.data(), value.size());
        }
        else if (key == "BinType") {
            hdr.bin_type.assign(value.data(), value.size());
        }
        else if (key == "BinSize") {
            int64_t v = metadata_int(key, value);
            if (v <= 0 || v > (int64_t)std::numeric_limits<uint32_t>::max()) {
                throw InputError("Invalid #BinSize=" + std::string(value));
            }
            hdr.source_bin_size = (uint32_t)v;
        }
        else if (key == "OffsetX") {
            hdr.offset_x = metadata_int(key, value);
        }
        else if (key == "OffsetY") {
            hdr.offset_y = metadata_int(key, value);
        }
    }

    void parse_column_header(const std::string& line, GemHeader& hdr) {
        std::vector<std::string_view> f;
        split_tabs(strip_cr(line), f);
        for (auto& c : f) c = trim(c);

        auto fail = [&](const std::string& why) {
            throw InputError("Invalid GEM header (" + why + "): " + line);
        };

        if (f.size() != 4 && f.size() != 5) fail("expected 4 or 5 columns");
        if (f[0] != "geneID") fail("column 1 must be geneID");
        if (f[1] != "x") fail("column 2 must be x");
        if (f[2] != "y") fail("column 3 must be y");
        if (f[3] != "MIDCount" && f[3] != "MIDCounts" && f[3] != "UMICount") {
            fail("column 4 must be MIDCount");
        }
        if (f.size() == 5 && f[4] != "ExonCount") fail("column 5 must be ExonCount");

        hdr.has_exon = (f.size() == 5);
    }

    // ============================ GemParser ============================

    bool GemParser::readline(std::string& line) {
        if (!src_.readline(line)) return false;
        ++line_no_;
        return true;
    }

    const GemHeader& GemParser::read_header() {
        if (header_done_) return hdr_;

        while (readline(line_)) {
            std::string_view s = strip_cr(line_);
            if (s.empty()) continue;
            if (s.front() == '#') {
                apply_metadata_line(line_, hdr_);
                continue;
            }
            parse_column_header(line_, hdr_);
            hdr_.header_line_no = line_no_;
            header_done_ = true;
            return hdr_;
        }
        throw InputError("No GEM column header (geneID ...) found in " + src_.name());
    }

    GemParser::Status GemParser::next(GemRecord& rec, LineError& err) {
        if (!header_done_) read_header();

        while (readline(line_)) {
            std::string_view s = strip_cr(line_);
            if (s.empty() || s.front() == '#') continue;

            std::string reason;
            if (parse_gem_line(line_, hdr_.has_exon, rec, reason)) return Status::Record;

            err.line_no = line_no_;
            err.raw = line_;
            err.reason = std::move(reason);
            return Status::Error;
        }
        return Status::End;
    }

} // namespace gem2bgef
