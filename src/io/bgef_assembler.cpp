#include "io/bgef_assembler.hpp"

#include <filesystem>
#include <system_error>
#include <vector>
#include "common/errors.hpp"
#include "common/log.hpp"

namespace fs = std::filesystem;

namespace gem2bgef {

    void BgefAssembler::check_document() const {
        if (!doc_.genes.is_frozen()) throw InvariantError("gene dictionary must be frozen before assembly");
        if (doc_.genes.size() == 0) throw InvariantError("gene dictionary is empty");
        if (doc_.results.empty()) throw InvariantError("document has no bin sections");
        if (doc_.results.size() != doc_.bin_sizes.size()) {
            throw InvariantError("document has " + std::to_string(doc_.results.size())
                + " sections for " + std::to_string(doc_.bin_sizes.size()) + " bin sizes");
        }
    }

    void BgefAssembler::write_root_attrs(H5Writer& w) const {
        const hid_t root = w.root();
        w.write_attr<uint32_t>(root, "resolution", doc_.resolution);
        w.write_attr_array<uint32_t>(root, "binList", doc_.bin_sizes);
        w.write_attr<uint32_t>(root, "version", kBgefFormatVersion);
        w.write_attr_string(root, "sampleId", doc_.header.sample_id.empty() ? "unknown" : doc_.header.sample_id);
        w.write_attr_string(root, "omics", doc_.omics);
        // Binning of the input GEM itself (#BinType / #BinSize).
        w.write_attr_string(root, "binType", doc_.header.bin_type);
        w.write_attr<uint32_t>(root, "sourceBinSize", doc_.header.source_bin_size);
        w.write_attr<int64_t>(root, "offsetX", doc_.header.offset_x);
        w.write_attr<int64_t>(root, "offsetY", doc_.header.offset_y);
    }

    void BgefAssembler::write_section(H5Writer& w, hid_t gene_exp, const BinResult& r) const {
        const uint32_t n_genes = doc_.genes.size();
        SectionStats S = compute_section_stats(r, n_genes);

        const std::string name = "bin" + std::to_string(r.bin_size);
        H5Handle grp = w.create_group(gene_exp, name);
        const hid_t g = grp.id();

        // Gene dictionary, index order.
        w.write_string_dataset(g, "geneNames", doc_.genes.names());

        // Sparse expression table, canonical order.
        const size_t n = r.entries.size();
        std::vector<uint32_t> gene_index(n);
        std::vector<int64_t> bx(n), by(n);
        std::vector<uint64_t> mid(n), exon(n);
        for (size_t i = 0; i < n; ++i) {
            const ExpressionEntry& e = r.entries[i];
            gene_index[i] = e.key.gene_index;
            bx[i] = e.key.bin_x;
            by[i] = e.key.bin_y;
            mid[i] = e.mid_count_sum;
            exon[i] = e.exon_count_sum;
        }
        w.write_dataset(g, "geneIndex", gene_index);
        w.write_dataset(g, "x", bx);
        w.write_dataset(g, "y", by);
        w.write_dataset(g, "midCount", mid);
        w.write_dataset(g, "exonCount", exon);

        // Per-gene offset table and extents.
        w.write_dataset(g, "geneOffset", S.gene_offset);
        w.write_dataset(g, "geneCount", S.gene_count);
        w.write_dataset(g, "geneMidCount", S.gene_mid);

        std::vector<int64_t> gminx(n_genes), gmaxx(n_genes), gminy(n_genes), gmaxy(n_genes);
        for (uint32_t i = 0; i < n_genes; ++i) {
            gminx[i] = r.gene_extents[i].min_x;
            gmaxx[i] = r.gene_extents[i].max_x;
            gminy[i] = r.gene_extents[i].min_y;
            gmaxy[i] = r.gene_extents[i].max_y;
        }
        w.write_dataset(g, "geneMinX", gminx);
        w.write_dataset(g, "geneMaxX", gmaxx);
        w.write_dataset(g, "geneMinY", gminy);
        w.write_dataset(g, "geneMaxY", gmaxy);

        // Section attributes. Lengths go through span_length and throw rather than wrap.
        w.write_attr<uint32_t>(g, "binSize", r.bin_size);
        w.write_attr<int64_t>(g, "minX", r.extent.min_x);
        w.write_attr<uint64_t>(g, "lenX", r.extent.len_x());
        w.write_attr<int64_t>(g, "minY", r.extent.min_y);
        w.write_attr<uint64_t>(g, "lenY", r.extent.len_y());
        w.write_attr<uint64_t>(g, "maxExp", S.max_exp);
        w.write_attr<uint64_t>(g, "maxExon", S.max_exon);
        w.write_attr<uint64_t>(g, "matrixLen", S.matrix_len);

        // Spot summary.
        H5Handle spot = w.create_group(g, "spot");
        w.write_dataset(spot.id(), "x", S.spots.x);
        w.write_dataset(spot.id(), "y", S.spots.y);
        w.write_dataset(spot.id(), "midCount", S.spots.mid_count);
        w.write_dataset(spot.id(), "exonCount", S.spots.exon_count);
        w.write_dataset(spot.id(), "geneCount", S.spots.gene_count);
        w.write_attr<uint64_t>(spot.id(), "number", (uint64_t)S.spots.x.size());
        w.write_attr<uint64_t>(spot.id(), "maxMID", S.max_mid);
        w.write_attr<uint32_t>(spot.id(), "maxGene", S.max_gene);

        log_msg("  " + name + ": " + std::to_string(S.matrix_len) + " entries, "
            + std::to_string(S.spots.x.size()) + " spots, maxExp=" + std::to_string(S.max_exp));
    }

    void BgefAssembler::write(const std::string& output_path) const {
        check_document();

        const std::string tmp = temp_path_for(output_path);
        try {
            {
                H5Writer w(tmp);
                write_root_attrs(w);

                H5Handle gene_exp = w.create_group(w.root(), "geneExp");
                for (size_t i = 0; i < doc_.results.size(); ++i) {
                    const BinResult& r = doc_.results[i];
                    if (r.bin_size != doc_.bin_sizes[i]) {
                        throw InvariantError("section " + std::to_string(i) + " holds bin"
                            + std::to_string(r.bin_size) + ", expected bin" + std::to_string(doc_.bin_sizes[i]));
                    }
                    write_section(w, gene_exp.id(), r);
                }
                if (gene_exp.close() < 0) throw AssemblyError("HDF5 error: close group geneExp");
                w.close();
            }

            std::error_code ec;
            fs::rename(tmp, output_path, ec);
            if (ec) throw AssemblyError("Failed to move " + tmp + " to " + output_path + ": " + ec.message());
        }
        catch (...) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw;
        }
    }

} // namespace gem2bgef
