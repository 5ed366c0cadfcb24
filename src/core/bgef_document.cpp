#include "core/bgef_document.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include "common/errors.hpp"

namespace gem2bgef {

    static std::string section_name(const BinResult& r) {
        return "bin" + std::to_string(r.bin_size);
    }

    SectionStats compute_section_stats(const BinResult& r, uint32_t n_genes) {
        const std::string sec = section_name(r);
        if (r.entries.empty()) throw InvariantError(sec + ": empty sparse table");
        if (r.gene_extents.size() != n_genes) {
            throw InvariantError(sec + ": per-gene extent table has " + std::to_string(r.gene_extents.size())
                + " rows, dictionary has " + std::to_string(n_genes));
        }

        SectionStats S;
        const size_t n = r.entries.size();
        S.matrix_len = n;
        S.gene_offset.assign(n_genes, 0);
        S.gene_count.assign(n_genes, 0);
        S.gene_mid.assign(n_genes, 0);

        for (size_t i = 0; i < n; ++i) {
            const ExpressionEntry& e = r.entries[i];
            if (e.key.gene_index >= n_genes) {
                throw InvariantError(sec + ": gene index " + std::to_string(e.key.gene_index)
                    + " outside dictionary");
            }
            if (i > 0 && !canonical_less(r.entries[i - 1].key, e.key)) {
                throw InvariantError(sec + ": sparse table not in canonical order at entry " + std::to_string(i));
            }

            const uint32_t g = e.key.gene_index;
            if (S.gene_count[g] == 0) S.gene_offset[g] = i;
            ++S.gene_count[g];
            S.gene_mid[g] += e.mid_count_sum;

            S.max_exp = std::max(S.max_exp, e.mid_count_sum);
            S.max_exon = std::max(S.max_exon, e.exon_count_sum);
        }

        // Genes without entries point at the end of their predecessor.
        uint64_t next = 0;
        for (uint32_t g = 0; g < n_genes; ++g) {
            if (S.gene_count[g] == 0) S.gene_offset[g] = next;
            next = S.gene_offset[g] + S.gene_count[g];
        }

        // Spot summary: regroup entries by (bin_y, bin_x).
        std::vector<size_t> order(n);
        std::iota(order.begin(), order.end(), (size_t)0);
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const BinKey& ka = r.entries[a].key;
            const BinKey& kb = r.entries[b].key;
            if (ka.bin_y != kb.bin_y) return ka.bin_y < kb.bin_y;
            if (ka.bin_x != kb.bin_x) return ka.bin_x < kb.bin_x;
            return ka.gene_index < kb.gene_index;
        });

        SpotTable& T = S.spots;
        for (size_t k = 0; k < n; ) {
            const BinKey& head = r.entries[order[k]].key;
            uint64_t mid = 0, exon = 0;
            uint32_t genes = 0;
            // Keys are unique, so each entry in a spot is a distinct gene.
            while (k < n && r.entries[order[k]].key.bin_y == head.bin_y
                && r.entries[order[k]].key.bin_x == head.bin_x) {
                mid += r.entries[order[k]].mid_count_sum;
                exon += r.entries[order[k]].exon_count_sum;
                ++genes;
                ++k;
            }
            T.x.push_back(head.bin_x);
            T.y.push_back(head.bin_y);
            T.mid_count.push_back(mid);
            T.exon_count.push_back(exon);
            T.gene_count.push_back(genes);
            S.max_mid = std::max(S.max_mid, mid);
            S.max_gene = std::max(S.max_gene, genes);
        }

        return S;
    }

} // namespace gem2bgef
