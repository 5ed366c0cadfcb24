// Unit tests for the single-pass conversion run (parse, error policy, region, fan-out)

#include "core/conversion.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "io/line_source.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace gem2bgef;

static ConvertConfig base_config(std::vector<uint32_t> bins) {
    ConvertConfig cfg;
    cfg.input_path = "<memory>";
    cfg.output_path = "<none>";
    cfg.bin_sizes = bins;
    return cfg;
}

static std::vector<std::string> example_lines() {
    return {
        "#FileFormat=GEMv0.2",
        "#Stereo-seqChip=B01020C2",
        "#OffsetX=100",
        "#OffsetY=-20",
        "geneID\tx\ty\tMIDCount\tExonCount",
        "geneA\t0\t0\t5\t2",
        "geneA\t1\t0\t3\t1",
        "geneB\t0\t1\t7\t0",
    };
}

void test_example_fan_out() {
    std::cout << "Testing fan-out over two bin sizes... ";
    ConvertConfig cfg = base_config({ 1, 2 });
    VectorLineSource src(example_lines());
    ConversionRun run(cfg);
    BgefDocument doc = run.run(src);

    assert(doc.genes.is_frozen());
    assert(doc.genes.size() == 2);
    assert(doc.genes.lookup(0) == "geneA");
    assert(doc.header.sample_id == "B01020C2");
    assert(doc.header.offset_x == 100 && doc.header.offset_y == -20);
    assert(doc.omics == "Transcriptomics");
    assert(doc.resolution == 1);

    assert(doc.results.size() == 2);
    assert(doc.results[0].bin_size == 1 && doc.results[0].entries.size() == 3);
    assert(doc.results[1].bin_size == 2 && doc.results[1].entries.size() == 2);
    assert(doc.results[1].entries[0].mid_count_sum == 8);
    assert(doc.results[1].entries[0].exon_count_sum == 3);
    assert(doc.results[1].entries[1].mid_count_sum == 7);
    for (const auto& r : doc.results) {
        assert(r.record_count == 3);
        assert(r.extent.len_x() == 2 && r.extent.len_y() == 2);
    }

    const ConversionSummary& s = run.summary();
    assert(s.records == 3);
    assert(s.lines_read == 8);
    assert(s.line_errors == 0 && s.filtered_out == 0);
    assert(s.genes == 2);
    std::cout << "PASSED\n";
}

void test_deterministic_order() {
    std::cout << "Testing deterministic ordering... ";
    std::vector<std::string> lines = { "geneID\tx\ty\tMIDCount" };
    for (int i = 0; i < 2000; ++i) {
        lines.push_back("g" + std::to_string((i * 7) % 13) + "\t" + std::to_string((i * 31) % 97 - 40)
            + "\t" + std::to_string((i * 17) % 89 - 30) + "\t" + std::to_string(i % 5 + 1));
    }
    ConvertConfig cfg = base_config({ 1, 10 });

    VectorLineSource a(lines);
    VectorLineSource b(lines);
    BgefDocument da = ConversionRun(cfg).run(a);
    BgefDocument db = ConversionRun(cfg).run(b);

    assert(da.genes.names() == db.genes.names());
    for (size_t k = 0; k < da.results.size(); ++k) {
        const auto& ea = da.results[k].entries;
        const auto& eb = db.results[k].entries;
        assert(ea.size() == eb.size());
        for (size_t i = 0; i < ea.size(); ++i) {
            assert(ea[i].key == eb[i].key);
            assert(ea[i].mid_count_sum == eb[i].mid_count_sum);
            if (i > 0) assert(canonical_less(ea[i - 1].key, ea[i].key));
        }
    }
    std::cout << "PASSED\n";
}

void test_skip_and_count() {
    std::cout << "Testing skip-and-count of bad lines... ";
    ConvertConfig cfg = base_config({ 1 });
    cfg.error_sample_limit = 2;
    VectorLineSource src({
        "geneID\tx\ty\tMIDCount",
        "geneA\t0\t0\t1",
        "geneA\tx\t0\t1",
        "geneA\t0\t0",
        "geneA\t0\t0\t-4",
        "geneB\t5\t5\t2",
    });
    ConversionRun run(cfg);
    BgefDocument doc = run.run(src);

    const ConversionSummary& s = run.summary();
    assert(s.records == 2);
    assert(s.line_errors == 3);
    assert(s.error_samples.size() == 2);
    assert(s.error_samples[0].line_no == 3);
    assert(s.error_samples[0].raw == "geneA\tx\t0\t1");
    assert(s.error_samples[1].line_no == 4);
    assert(doc.results[0].entries.size() == 2);
    std::cout << "PASSED\n";
}

void test_consecutive_error_threshold() {
    std::cout << "Testing consecutive error threshold... ";
    ConvertConfig cfg = base_config({ 1 });
    cfg.max_consecutive_errors = 2;

    // Errors separated by a good record do not accumulate.
    {
        VectorLineSource src({ "geneID\tx\ty\tMIDCount", "bad", "geneA\t0\t0\t1", "bad", "geneA\t1\t0\t1" });
        ConversionRun run(cfg);
        (void)run.run(src);
        assert(run.summary().line_errors == 2);
    }
    {
        VectorLineSource src({ "geneID\tx\ty\tMIDCount", "geneA\t0\t0\t1", "bad", "bad", "geneA\t1\t0\t1" });
        ConversionRun run(cfg);
        bool threw = false;
        try { (void)run.run(src); } catch (const InputError&) { threw = true; }
        assert(threw);
    }
    std::cout << "PASSED\n";
}

void test_region_filter() {
    std::cout << "Testing region filter... ";
    ConvertConfig cfg = base_config({ 1 });
    cfg.region = parse_region("0,10,0,10");
    VectorLineSource src({
        "geneID\tx\ty\tMIDCount",
        "geneA\t0\t0\t1",
        "geneA\t10\t10\t1",
        "geneB\t11\t5\t1",
        "geneC\t5\t-1\t1",
    });
    ConversionRun run(cfg);
    BgefDocument doc = run.run(src);

    assert(run.summary().records == 2);
    assert(run.summary().filtered_out == 2);
    assert(run.summary().line_errors == 0);
    // Filtered records never reach the dictionary.
    assert(doc.genes.size() == 1);
    assert(doc.results[0].extent.min_x == 0 && doc.results[0].extent.max_x == 10);
    std::cout << "PASSED\n";
}

void test_no_valid_records() {
    std::cout << "Testing input without valid records... ";
    ConvertConfig cfg = base_config({ 1 });
    {
        VectorLineSource src({ "geneID\tx\ty\tMIDCount" });
        bool threw = false;
        try { (void)ConversionRun(cfg).run(src); } catch (const InputError&) { threw = true; }
        assert(threw);
    }
    {
        VectorLineSource src({ "geneID\tx\ty\tMIDCount", "oops", "geneA\t1" });
        bool threw = false;
        try { (void)ConversionRun(cfg).run(src); } catch (const InputError&) { threw = true; }
        assert(threw);
    }
    {
        cfg.region = parse_region("100,200,100,200");
        VectorLineSource src({ "geneID\tx\ty\tMIDCount", "geneA\t1\t1\t1" });
        bool threw = false;
        try { (void)ConversionRun(cfg).run(src); } catch (const InputError&) { threw = true; }
        assert(threw);
    }
    std::cout << "PASSED\n";
}

void test_omics_and_resolution() {
    std::cout << "Testing omics and resolution attributes... ";
    {
        ConvertConfig cfg = base_config({ 1 });
        VectorLineSource src({ "#Omics=Proteomics", "geneID\tx\ty\tMIDCount", "P1\t0\t0\t3" });
        BgefDocument doc = ConversionRun(cfg).run(src);
        assert(doc.omics == "Proteomics");
        assert(doc.header.sample_id == "unknown");
    }
    {
        ConvertConfig cfg = base_config({ 1 });
        cfg.omics = "Metabolomics";
        cfg.resolution = 500;
        VectorLineSource src({ "#Omics=Proteomics", "geneID\tx\ty\tMIDCount", "P1\t0\t0\t3" });
        BgefDocument doc = ConversionRun(cfg).run(src);
        assert(doc.omics == "Metabolomics");
        assert(doc.resolution == 500);
    }
    std::cout << "PASSED\n";
}

void test_progress_logging() {
    std::cout << "Testing progress interval... ";
    ConvertConfig cfg = base_config({ 1 });
    cfg.progress_interval = 2;
    std::vector<std::string> lines = { "geneID\tx\ty\tMIDCount" };
    for (int i = 0; i < 7; ++i) lines.push_back("g\t" + std::to_string(i) + "\t0\t1");
    VectorLineSource src(lines);
    ConversionRun run(cfg);
    BgefDocument doc = run.run(src);
    assert(run.summary().records == 7);
    assert(doc.results[0].entries.size() == 7);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== Conversion Tests ===\n";
    set_log_quiet(true);
    test_example_fan_out();
    test_deterministic_order();
    test_skip_and_count();
    test_consecutive_error_threshold();
    test_region_filter();
    test_no_valid_records();
    test_omics_and_resolution();
    test_progress_logging();
    std::cout << "\nAll conversion tests passed!\n";
    return 0;
}
