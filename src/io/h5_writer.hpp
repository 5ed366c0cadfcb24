#pragma once
#include <cstdint>
#include <string>
#include <vector>

extern "C" {
#include <hdf5.h>
}

namespace gem2bgef {

	// Owns one HDF5 identifier and closes it with the matching H5*close.
	class H5Handle {
	public:
		enum class Kind { File, Group, Dataset, Dataspace, Datatype, Attribute, PropList };

		H5Handle() = default;
		H5Handle(hid_t id, Kind kind) : id_(id), kind_(kind) {}
		~H5Handle() { (void)close(); }

		H5Handle(const H5Handle&) = delete;
		H5Handle& operator=(const H5Handle&) = delete;
		H5Handle(H5Handle&& o) noexcept : id_(o.id_), kind_(o.kind_) { o.id_ = -1; }
		H5Handle& operator=(H5Handle&& o) noexcept;

		hid_t id() const { return id_; }
		bool valid() const { return id_ >= 0; }

		// Returns the H5*close status; the handle is released either way.
		herr_t close();

	private:
		hid_t id_ = -1;
		Kind kind_ = Kind::Dataspace;
	};

	// Memory / file type pair for the numeric element types of a bGEF file.
	template <typename T> struct H5NumType;
	template <> struct H5NumType<uint32_t> {
		static hid_t mem() { return H5T_NATIVE_UINT32; }
		static hid_t file() { return H5T_STD_U32LE; }
	};
	template <> struct H5NumType<uint64_t> {
		static hid_t mem() { return H5T_NATIVE_UINT64; }
		static hid_t file() { return H5T_STD_U64LE; }
	};
	template <> struct H5NumType<int32_t> {
		static hid_t mem() { return H5T_NATIVE_INT32; }
		static hid_t file() { return H5T_STD_I32LE; }
	};
	template <> struct H5NumType<int64_t> {
		static hid_t mem() { return H5T_NATIVE_INT64; }
		static hid_t file() { return H5T_STD_I64LE; }
	};

	// Storage capability surface for the assembler: create groups, 1-D datasets
	// and attributes in a freshly truncated HDF5 file. Every failure throws
	// AssemblyError naming the object.
	class H5Writer {
	public:
		explicit H5Writer(const std::string& path);

		H5Writer(const H5Writer&) = delete;
		H5Writer& operator=(const H5Writer&) = delete;

		hid_t root() const { return file_.id(); }
		const std::string& path() const { return path_; }

		H5Handle create_group(hid_t parent, const std::string& name);

		template <typename T>
		void write_dataset(hid_t loc, const std::string& name, const std::vector<T>& data) {
			write_dataset_raw(loc, name, H5NumType<T>::mem(), H5NumType<T>::file(),
				data.size(), data.empty() ? nullptr : data.data());
		}

		// Variable-length UTF-8 strings.
		void write_string_dataset(hid_t loc, const std::string& name, const std::vector<std::string>& data);

		template <typename T>
		void write_attr(hid_t obj, const std::string& name, T value) {
			write_attr_raw(obj, name, H5NumType<T>::mem(), H5NumType<T>::file(), true, 1, &value);
		}

		template <typename T>
		void write_attr_array(hid_t obj, const std::string& name, const std::vector<T>& values) {
			write_attr_raw(obj, name, H5NumType<T>::mem(), H5NumType<T>::file(),
				false, values.size(), values.empty() ? nullptr : values.data());
		}

		void write_attr_string(hid_t obj, const std::string& name, const std::string& value);

		// Flush and close the file. Throws AssemblyError if HDF5 reports a failure.
		void close();

	private:
		void write_dataset_raw(hid_t loc, const std::string& name, hid_t mem_type, hid_t file_type,
			size_t n, const void* buf);
		void write_attr_raw(hid_t obj, const std::string& name, hid_t mem_type, hid_t file_type,
			bool scalar, size_t n, const void* buf);

		std::string path_;
		H5Handle file_;
	};

} // namespace gem2bgef
