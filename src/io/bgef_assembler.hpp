#pragma once
#include <string>
#include "core/bgef_document.hpp"
#include "io/h5_writer.hpp"

namespace gem2bgef {

	// Serialises a BgefDocument into a bGEF (HDF5) file:
	//
	//   /                      resolution, binList, version, sampleId, omics, binType,
	//                          sourceBinSize, offsetX, offsetY
	//   /geneExp/bin{N}/       geneNames, geneIndex, x, y, midCount, exonCount,
	//                          geneOffset, geneCount, geneMidCount, geneMinX/MaxX/MinY/MaxY
	//                          attrs binSize, minX, lenX, minY, lenY, maxExp, maxExon, matrixLen
	//   /geneExp/bin{N}/spot/  x, y, midCount, exonCount, geneCount; attrs number, maxMID, maxGene
	//
	// The file is built at "<output>.tmp" and renamed onto the output path only
	// after it closed cleanly. On failure the temp file is removed and nothing
	// appears at the output path.
	class BgefAssembler {
	public:
		explicit BgefAssembler(const BgefDocument& doc) : doc_(doc) {}

		// Throws AssemblyError (I/O) or InvariantError (inconsistent document).
		void write(const std::string& output_path) const;

		static std::string temp_path_for(const std::string& output_path) { return output_path + ".tmp"; }

	private:
		void check_document() const;
		void write_root_attrs(H5Writer& w) const;
		void write_section(H5Writer& w, hid_t gene_exp, const BinResult& r) const;

		const BgefDocument& doc_;
	};

} // namespace gem2bgef
