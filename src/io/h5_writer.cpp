#include "io/h5_writer.hpp"

#include <algorithm>
#include <string>
#include <vector>
#include "common/errors.hpp"

namespace gem2bgef {

    // ============================ HDF5 helpers ============================

    static inline void h5_check(herr_t status, const std::string& msg) {
        if (status < 0) throw AssemblyError("HDF5 error: " + msg);
    }

    static inline hid_t h5_check_id(hid_t id, const std::string& msg) {
        if (id < 0) throw AssemblyError("HDF5 error: " + msg);
        return id;
    }

    // Chunk length for 1-D datasets: whole array up to 1M elements.
    static constexpr hsize_t kMaxChunk = 1u << 20;
    static constexpr unsigned kDeflateLevel = 4;

    // ============================ H5Handle ============================

    H5Handle& H5Handle::operator=(H5Handle&& o) noexcept {
        if (this != &o) {
            (void)close();
            id_ = o.id_;
            kind_ = o.kind_;
            o.id_ = -1;
        }
        return *this;
    }

    herr_t H5Handle::close() {
        if (id_ < 0) return 0;
        herr_t st = 0;
        switch (kind_) {
        case Kind::File:      st = H5Fclose(id_); break;
        case Kind::Group:     st = H5Gclose(id_); break;
        case Kind::Dataset:   st = H5Dclose(id_); break;
        case Kind::Dataspace: st = H5Sclose(id_); break;
        case Kind::Datatype:  st = H5Tclose(id_); break;
        case Kind::Attribute: st = H5Aclose(id_); break;
        case Kind::PropList:  st = H5Pclose(id_); break;
        }
        id_ = -1;
        return st;
    }

    // ============================ H5Writer ============================

    H5Writer::H5Writer(const std::string& path) : path_(path) {
        // Failures surface as AssemblyError naming the object; no HDF5 stack dump on stderr.
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
        H5Handle fapl(h5_check_id(H5Pcreate(H5P_FILE_ACCESS), "H5Pcreate fapl"), H5Handle::Kind::PropList);
        // Closing the file also closes anything still open in it.
        h5_check(H5Pset_fclose_degree(fapl.id(), H5F_CLOSE_STRONG), "H5Pset_fclose_degree");

        hid_t file = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, fapl.id());
        if (file < 0) throw AssemblyError("Failed to create HDF5 file: " + path);
        file_ = H5Handle(file, H5Handle::Kind::File);
    }

    H5Handle H5Writer::create_group(hid_t parent, const std::string& name) {
        hid_t g = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        return H5Handle(h5_check_id(g, "create group " + name), H5Handle::Kind::Group);
    }

    void H5Writer::write_dataset_raw(hid_t loc, const std::string& name, hid_t mem_type, hid_t file_type,
        size_t n, const void* buf) {
        hsize_t dims[1] = { static_cast<hsize_t>(n) };
        H5Handle space(h5_check_id(H5Screate_simple(1, dims, nullptr), "dataspace for " + name),
            H5Handle::Kind::Dataspace);

        H5Handle dcpl(h5_check_id(H5Pcreate(H5P_DATASET_CREATE), "dcpl for " + name), H5Handle::Kind::PropList);
        if (n > 0) {
            hsize_t chunk[1] = { std::min<hsize_t>(dims[0], kMaxChunk) };
            h5_check(H5Pset_chunk(dcpl.id(), 1, chunk), "H5Pset_chunk " + name);
            h5_check(H5Pset_deflate(dcpl.id(), kDeflateLevel), "H5Pset_deflate " + name);
        }

        H5Handle dset(h5_check_id(H5Dcreate2(loc, name.c_str(), file_type, space.id(), H5P_DEFAULT, dcpl.id(), H5P_DEFAULT),
            "create dataset " + name), H5Handle::Kind::Dataset);
        if (n > 0) {
            h5_check(H5Dwrite(dset.id(), mem_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buf), "write dataset " + name);
        }
        h5_check(dset.close(), "close dataset " + name);
    }

    void H5Writer::write_string_dataset(hid_t loc, const std::string& name, const std::vector<std::string>& data) {
        H5Handle stype(h5_check_id(H5Tcopy(H5T_C_S1), "H5Tcopy"), H5Handle::Kind::Datatype);
        h5_check(H5Tset_size(stype.id(), H5T_VARIABLE), "H5Tset_size vlen");
        h5_check(H5Tset_cset(stype.id(), H5T_CSET_UTF8), "H5Tset_cset");

        hsize_t dims[1] = { static_cast<hsize_t>(data.size()) };
        H5Handle space(h5_check_id(H5Screate_simple(1, dims, nullptr), "dataspace for " + name),
            H5Handle::Kind::Dataspace);
        H5Handle dset(h5_check_id(H5Dcreate2(loc, name.c_str(), stype.id(), space.id(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT),
            "create dataset " + name), H5Handle::Kind::Dataset);

        if (!data.empty()) {
            std::vector<const char*> ptrs;
            ptrs.reserve(data.size());
            for (const auto& s : data) ptrs.push_back(s.c_str());
            h5_check(H5Dwrite(dset.id(), stype.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data()),
                "write dataset " + name);
        }
        h5_check(dset.close(), "close dataset " + name);
    }

    void H5Writer::write_attr_raw(hid_t obj, const std::string& name, hid_t mem_type, hid_t file_type,
        bool scalar, size_t n, const void* buf) {
        hid_t sp = -1;
        if (scalar) {
            sp = H5Screate(H5S_SCALAR);
        }
        else {
            hsize_t dims[1] = { static_cast<hsize_t>(n) };
            sp = H5Screate_simple(1, dims, nullptr);
        }
        H5Handle space(h5_check_id(sp, "dataspace for attribute " + name), H5Handle::Kind::Dataspace);
        H5Handle attr(h5_check_id(H5Acreate2(obj, name.c_str(), file_type, space.id(), H5P_DEFAULT, H5P_DEFAULT),
            "create attribute " + name), H5Handle::Kind::Attribute);
        if (scalar || n > 0) {
            h5_check(H5Awrite(attr.id(), mem_type, buf), "write attribute " + name);
        }
        h5_check(attr.close(), "close attribute " + name);
    }

    void H5Writer::write_attr_string(hid_t obj, const std::string& name, const std::string& value) {
        H5Handle stype(h5_check_id(H5Tcopy(H5T_C_S1), "H5Tcopy"), H5Handle::Kind::Datatype);
        h5_check(H5Tset_size(stype.id(), H5T_VARIABLE), "H5Tset_size vlen");
        h5_check(H5Tset_cset(stype.id(), H5T_CSET_UTF8), "H5Tset_cset");

        H5Handle space(h5_check_id(H5Screate(H5S_SCALAR), "dataspace for attribute " + name),
            H5Handle::Kind::Dataspace);
        H5Handle attr(h5_check_id(H5Acreate2(obj, name.c_str(), stype.id(), space.id(), H5P_DEFAULT, H5P_DEFAULT),
            "create attribute " + name), H5Handle::Kind::Attribute);

        const char* p = value.c_str();
        h5_check(H5Awrite(attr.id(), stype.id(), &p), "write attribute " + name);
        h5_check(attr.close(), "close attribute " + name);
    }

    void H5Writer::close() {
        if (!file_.valid()) return;
        h5_check(H5Fflush(file_.id(), H5F_SCOPE_GLOBAL), "flush " + path_);
        h5_check(file_.close(), "close " + path_);
    }

} // namespace gem2bgef
