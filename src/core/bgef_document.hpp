#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "core/gene_dictionary.hpp"

namespace gem2bgef {

    // Written to the root "version" attribute.
    constexpr uint32_t kBgefFormatVersion = 4;

    // Everything one conversion produces. Built once, written once.
    struct BgefDocument {
        uint32_t resolution = 1;             // opaque pass-through
        GemHeader header;                    // sample id, omics, offsets
        std::string omics;                   // effective omics label
        std::vector<uint32_t> bin_sizes;     // order of sections; results[i].bin_size == bin_sizes[i]
        std::vector<BinResult> results;
        GeneDictionary genes;                // frozen
    };

    // One row per occupied (bin_x, bin_y), ordered by (bin_y, bin_x).
    struct SpotTable {
        std::vector<int64_t>  x;
        std::vector<int64_t>  y;
        std::vector<uint64_t> mid_count;
        std::vector<uint64_t> exon_count;
        std::vector<uint32_t> gene_count;   // distinct genes in the spot
    };

    // Derived per-section values written next to the sparse table.
    struct SectionStats {
        uint64_t matrix_len = 0;
        uint64_t max_exp = 0;      // largest single entry MID sum
        uint64_t max_exon = 0;

        // Indexed by gene: entries [offset, offset + count) of the sparse arrays.
        std::vector<uint64_t> gene_offset;
        std::vector<uint64_t> gene_count;
        std::vector<uint64_t> gene_mid;

        SpotTable spots;
        uint64_t max_mid = 0;      // largest spot MID sum
        uint32_t max_gene = 0;     // largest spot gene count
    };

    // Validates the result against the dictionary (canonical order, unique keys,
    // gene indices in range, per-gene extent table size) and computes the stats.
    // Throws InvariantError.
    SectionStats compute_section_stats(const BinResult& r, uint32_t n_genes);

} // namespace gem2bgef
