#pragma once
#include <cstdint>
#include <unordered_map>
#include <vector>
#include "common/types.hpp"
#include "core/coord.hpp"
#include "core/gene_dictionary.hpp"

namespace gem2bgef {

    struct BinKeyHash {
        size_t operator()(const BinKey& k) const noexcept {
            // splitmix-style mix of the three fields
            uint64_t h = (uint64_t)k.bin_x * 0x9E3779B97F4A7C15ULL;
            h ^= (uint64_t)k.bin_y + 0xBF58476D1CE4E5B9ULL + (h << 6) + (h >> 2);
            h ^= (uint64_t)k.gene_index + 0x94D049BB133111EBULL + (h << 6) + (h >> 2);
            h ^= h >> 31;
            return (size_t)h;
        }
    };

    // Folds GEM records into the sparse (gene, bin_x, bin_y) table of one bin size.
    // Several aggregators may share one dictionary; each keeps its own table and extents.
    class BinAggregator {
    public:
        // Throws ConfigError if bin_size is 0.
        BinAggregator(uint32_t bin_size, GeneDictionary& genes);

        void consume(const GemRecord& rec);

        // Sort into canonical order and hand the result over. The aggregator
        // cannot be used afterwards.
        BinResult finish();

        uint32_t bin_size() const { return bin_size_; }
        size_t   n_entries() const { return table_.size(); }

    private:
        struct Sums {
            uint64_t mid = 0;
            uint64_t exon = 0;
        };

        uint32_t bin_size_;
        GeneDictionary& genes_;
        bool finished_ = false;

        std::unordered_map<BinKey, Sums, BinKeyHash> table_;
        ExtentTracker global_;
        std::vector<ExtentTracker> per_gene_;  // indexed by gene index
        uint64_t n_records_ = 0;
    };

} // namespace gem2bgef
