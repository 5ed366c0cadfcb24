// Unit tests for GEM line, metadata and header parsing

#include "io/gem_parser.hpp"
#include "io/line_source.hpp"
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <zlib.h>

using namespace gem2bgef;

void test_parse_line() {
    std::cout << "Testing parse_gem_line... ";
    GemRecord rec;
    std::string reason;
    assert(parse_gem_line("geneA\t-3\t12\t5", false, rec, reason));
    assert(rec.gene_id == "geneA");
    assert(rec.x == -3 && rec.y == 12);
    assert(rec.mid_count == 5 && rec.exon_count == 0);

    assert(parse_gem_line("geneB\t1\t2\t7\t4\r", true, rec, reason));
    assert(rec.gene_id == "geneB" && rec.mid_count == 7 && rec.exon_count == 4);

    // Explicit plus signs are plain integers.
    assert(parse_gem_line("g\t+5\t1\t+1\t+0", true, rec, reason));
    assert(rec.x == 5 && rec.y == 1 && rec.mid_count == 1 && rec.exon_count == 0);
    std::cout << "PASSED\n";
}

void test_parse_line_errors() {
    std::cout << "Testing parse_gem_line errors... ";
    GemRecord rec;
    std::string reason;
    assert(!parse_gem_line("geneA\t1\t2", false, rec, reason));
    assert(reason.find("columns") != std::string::npos);
    assert(!parse_gem_line("geneA\t1\t2\t3", true, rec, reason));
    assert(!parse_gem_line("\t1\t2\t3", false, rec, reason));
    assert(reason == "empty geneID");
    assert(!parse_gem_line("geneA\t1.5\t2\t3", false, rec, reason));
    assert(reason == "non-integer x");
    assert(!parse_gem_line("geneA\t1\tfoo\t3", false, rec, reason));
    assert(reason == "non-integer y");
    assert(!parse_gem_line("geneA\t1\t2\t-3", false, rec, reason));
    assert(reason == "negative MIDCount");
    assert(!parse_gem_line("geneA\t1\t2\t4294967296", false, rec, reason));
    assert(reason.find("32-bit") != std::string::npos);
    assert(!parse_gem_line("geneA\t1\t2\t3\tx", true, rec, reason));
    assert(reason == "non-integer ExonCount");
    assert(!parse_gem_line("geneA\t+\t2\t3", false, rec, reason));
    assert(reason == "non-integer x");
    assert(!parse_gem_line("geneA\t++1\t2\t3", false, rec, reason));
    assert(reason == "non-integer x");
    assert(!parse_gem_line("geneA\t+-1\t2\t3", false, rec, reason));
    assert(reason == "non-integer x");
    assert(!parse_gem_line("geneA\t1\t2\t+-3", false, rec, reason));
    assert(reason == "non-integer MIDCount");
    std::cout << "PASSED\n";
}

void test_metadata() {
    std::cout << "Testing metadata lines... ";
    GemHeader h;
    assert(h.sample_id == "unknown");
    assert(h.omics == "Transcriptomics");
    apply_metadata_line("#FileFormat=GEMv0.1", h);
    apply_metadata_line("#Stereo-seqChip=SS200000135TL_D1", h);
    apply_metadata_line("#Omics=Proteomics", h);
    apply_metadata_line("#BinType=Bin", h);
    apply_metadata_line("#BinSize=1", h);
    apply_metadata_line("#OffsetX=-250", h);
    apply_metadata_line("#OffsetY=1000\r", h);
    apply_metadata_line("# free comment", h);
    assert(h.sample_id == "SS200000135TL_D1");
    assert(h.omics == "Proteomics");
    assert(h.bin_type == "Bin");
    assert(h.source_bin_size == 1);
    assert(h.offset_x == -250 && h.offset_y == 1000);

    bool threw = false;
    try { apply_metadata_line("#OffsetX=12a", h); } catch (const InputError&) { threw = true; }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_column_header() {
    std::cout << "Testing column header... ";
    GemHeader h;
    parse_column_header("geneID\tx\ty\tMIDCount", h);
    assert(!h.has_exon);
    parse_column_header("geneID\tx\ty\tMIDCount\tExonCount", h);
    assert(h.has_exon);
    parse_column_header("geneID\tx\ty\tUMICount", h);
    assert(!h.has_exon);

    bool threw = false;
    try { parse_column_header("gene\tx\ty\tMIDCount", h); } catch (const InputError&) { threw = true; }
    assert(threw);
    threw = false;
    try { parse_column_header("geneID\tx\ty", h); } catch (const InputError&) { threw = true; }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_parser_stream() {
    std::cout << "Testing GemParser stream... ";
    VectorLineSource src({
        "#Stereo-seqChip=CHIP1",
        "",
        "geneID\tx\ty\tMIDCount\tExonCount",
        "geneA\t0\t0\t5\t2",
        "bad line",
        "",
        "geneB\t0\t1\t7\t0",
    });
    GemParser p(src);
    const GemHeader& h = p.read_header();
    assert(h.sample_id == "CHIP1");
    assert(h.has_exon);
    assert(h.header_line_no == 3);

    GemRecord rec;
    LineError err;
    assert(p.next(rec, err) == GemParser::Status::Record);
    assert(rec.gene_id == "geneA" && rec.exon_count == 2);
    assert(p.next(rec, err) == GemParser::Status::Error);
    assert(err.line_no == 5);
    assert(err.raw == "bad line");
    assert(p.next(rec, err) == GemParser::Status::Record);
    assert(rec.gene_id == "geneB" && rec.y == 1);
    assert(p.next(rec, err) == GemParser::Status::End);
    assert(p.lines_read() == 7);
    std::cout << "PASSED\n";
}

void test_missing_header() {
    std::cout << "Testing missing header... ";
    VectorLineSource src({ "#OffsetX=0", "" });
    GemParser p(src);
    bool threw = false;
    try { p.read_header(); } catch (const InputError&) { threw = true; }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_gzip_source() {
    std::cout << "Testing gzip line source... ";
    const std::string path = (std::filesystem::temp_directory_path() / "gem2bgef_test_parser.gem.gz").string();
    {
        gzFile gz = gzopen(path.c_str(), "wb");
        assert(gz != nullptr);
        const std::string body = "geneID\tx\ty\tMIDCount\ngeneA\t3\t4\t1\n"
            + std::string(600000, 'g') + "\t1\t1\t1\n";
        assert(gzwrite(gz, body.data(), (unsigned)body.size()) == (int)body.size());
        assert(gzclose(gz) == Z_OK);
    }

    GzLineSource src(path);
    GemParser p(src);
    p.read_header();
    GemRecord rec;
    LineError err;
    assert(p.next(rec, err) == GemParser::Status::Record);
    assert(rec.gene_id == "geneA" && rec.x == 3 && rec.y == 4);
    // Lines longer than the read buffer come back whole.
    assert(p.next(rec, err) == GemParser::Status::Record);
    assert(rec.gene_id.size() == 600000);
    assert(p.next(rec, err) == GemParser::Status::End);

    std::filesystem::remove(path);

    bool threw = false;
    try { GzLineSource missing(path + ".missing"); } catch (const ConfigError&) { threw = true; }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_gzip_source_nul_byte() {
    std::cout << "Testing gzip line with a NUL byte... ";
    const std::string path = (std::filesystem::temp_directory_path() / "gem2bgef_test_nul.gem.gz").string();
    {
        gzFile gz = gzopen(path.c_str(), "wb");
        assert(gz != nullptr);
        std::string body = "geneID\tx\ty\tMIDCount\n";
        body += std::string("geneA\t0\t0\t5\0junk\n", 17);
        body += "geneB\t1\t1\t2\n";
        body += "geneC\t2\t2\tbad\n";
        assert(gzwrite(gz, body.data(), (unsigned)body.size()) == (int)body.size());
        assert(gzclose(gz) == Z_OK);
    }

    GzLineSource src(path);
    GemParser p(src);
    p.read_header();
    GemRecord rec;
    LineError err;

    // The NUL line is one malformed row and does not swallow the next one.
    assert(p.next(rec, err) == GemParser::Status::Error);
    assert(err.line_no == 2);
    assert(err.raw.size() == 16);
    assert(err.raw[11] == '\0');
    assert(err.reason == "non-integer MIDCount");

    assert(p.next(rec, err) == GemParser::Status::Record);
    assert(rec.gene_id == "geneB" && rec.x == 1 && rec.mid_count == 2);

    assert(p.next(rec, err) == GemParser::Status::Error);
    assert(err.line_no == 4);
    assert(err.raw == "geneC\t2\t2\tbad");

    assert(p.next(rec, err) == GemParser::Status::End);
    assert(p.lines_read() == 4);

    std::filesystem::remove(path);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== GEM Parser Tests ===\n";
    test_parse_line();
    test_parse_line_errors();
    test_metadata();
    test_column_header();
    test_parser_stream();
    test_missing_header();
    test_gzip_source();
    test_gzip_source_nul_byte();
    std::cout << "\nAll GEM parser tests passed!\n";
    return 0;
}
