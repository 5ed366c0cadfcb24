#include "core/bin_aggregator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include "common/errors.hpp"

namespace gem2bgef {

    BinAggregator::BinAggregator(uint32_t bin_size, GeneDictionary& genes)
        : bin_size_(bin_size), genes_(genes) {
        if (bin_size_ == 0) throw ConfigError("bin size must be a positive integer");
    }

    static inline void add_checked(uint64_t& acc, uint32_t v, const char* what) {
        const uint64_t next = acc + v;
        if (next < acc) throw InvariantError(std::string(what) + " sum overflowed 64 bits");
        acc = next;
    }

    void BinAggregator::consume(const GemRecord& rec) {
        if (finished_) throw std::logic_error("BinAggregator::consume after finish");

        const uint32_t g = genes_.intern(rec.gene_id);

        BinKey key;
        key.gene_index = g;
        key.bin_x = floor_div(rec.x, (int64_t)bin_size_);
        key.bin_y = floor_div(rec.y, (int64_t)bin_size_);

        Sums& s = table_[key];
        add_checked(s.mid, rec.mid_count, "MIDCount");
        add_checked(s.exon, rec.exon_count, "ExonCount");

        // Extents stay in original coordinate space.
        global_.add(rec.x, rec.y);
        if (g >= per_gene_.size()) per_gene_.resize((size_t)g + 1);
        per_gene_[g].add(rec.x, rec.y);

        ++n_records_;
    }

    BinResult BinAggregator::finish() {
        if (finished_) throw std::logic_error("BinAggregator::finish called twice");
        finished_ = true;

        BinResult out;
        out.bin_size = bin_size_;
        out.record_count = n_records_;
        out.extent = global_.extent();  // EmptyExtentError on an empty pass

        // All aggregators of a run see the same records, so every gene in the
        // shared dictionary must have been seen here too.
        const uint32_t n_genes = genes_.size();
        out.gene_extents.resize(n_genes);
        for (uint32_t g = 0; g < n_genes; ++g) {
            if (g < per_gene_.size() && !per_gene_[g].empty()) {
                out.gene_extents[g] = per_gene_[g].extent();
            }
            else {
                throw InvariantError("bin" + std::to_string(bin_size_) + ": gene '"
                    + genes_.lookup(g) + "' has no records");
            }
        }

        out.entries.reserve(table_.size());
        for (const auto& kv : table_) {
            ExpressionEntry e;
            e.key = kv.first;
            e.mid_count_sum = kv.second.mid;
            e.exon_count_sum = kv.second.exon;
            out.entries.push_back(e);
        }
        table_.clear();
        per_gene_.clear();

        std::sort(out.entries.begin(), out.entries.end(),
            [](const ExpressionEntry& a, const ExpressionEntry& b) { return canonical_less(a.key, b.key); });

        for (size_t i = 1; i < out.entries.size(); ++i) {
            if (out.entries[i - 1].key == out.entries[i].key) {
                const BinKey& k = out.entries[i].key;
                throw InvariantError("bin" + std::to_string(bin_size_) + ": duplicate key (gene="
                    + std::to_string(k.gene_index) + ", x=" + std::to_string(k.bin_x)
                    + ", y=" + std::to_string(k.bin_y) + ")");
            }
        }

        return out;
    }

} // namespace gem2bgef
