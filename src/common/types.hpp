#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace gem2bgef {

	struct GemRecord {
		std::string gene_id;
		int64_t  x = 0;
		int64_t  y = 0;
		uint32_t mid_count = 0;
		uint32_t exon_count = 0;   // 0 when the input has no ExonCount column
	};

	// Metadata collected from the leading "#key=value" lines and the column header.
	struct GemHeader {
		std::string sample_id = "unknown";      // #Stereo-seqChip / #SampleID / #sn
		std::string omics = "Transcriptomics";  // #Omics
		std::string bin_type;                   // #BinType
		uint32_t source_bin_size = 1;           // #BinSize
		int64_t  offset_x = 0;                  // #OffsetX
		int64_t  offset_y = 0;                  // #OffsetY
		bool     has_exon = false;              // header has a 5th ExonCount column
		uint64_t header_line_no = 0;            // 1-based line of the column header
	};

	// Bounding box in original (unbinned) coordinates, inclusive on both ends.
	struct Extent {
		int64_t min_x = 0;
		int64_t max_x = 0;
		int64_t min_y = 0;
		int64_t max_y = 0;

		// max - min + 1; throws InvariantError if not representable (see core/coord).
		uint64_t len_x() const;
		uint64_t len_y() const;
	};

	struct BinKey {
		uint32_t gene_index = 0;
		int64_t  bin_x = 0;
		int64_t  bin_y = 0;

		bool operator==(const BinKey& o) const {
			return gene_index == o.gene_index && bin_x == o.bin_x && bin_y == o.bin_y;
		}
	};

	// Canonical order of a sparse table: gene, then row (y), then column (x).
	inline bool canonical_less(const BinKey& a, const BinKey& b) {
		if (a.gene_index != b.gene_index) return a.gene_index < b.gene_index;
		if (a.bin_y != b.bin_y) return a.bin_y < b.bin_y;
		return a.bin_x < b.bin_x;
	}

	struct ExpressionEntry {
		BinKey   key;
		uint64_t mid_count_sum = 0;    // 64-bit: dense tissue overflows 32-bit sums
		uint64_t exon_count_sum = 0;
	};

	// Aggregation of the whole input at one bin size.
	struct BinResult {
		uint32_t bin_size = 1;
		Extent   extent;                             // global, unbinned coordinates
		std::vector<Extent> gene_extents;            // indexed by gene index
		std::vector<ExpressionEntry> entries;        // canonical order, unique keys
		uint64_t record_count = 0;                   // records folded into this result
	};

} // namespace gem2bgef
