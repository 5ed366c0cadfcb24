#include "core/gene_dictionary.hpp"

#include <limits>
#include <stdexcept>

namespace gem2bgef {

    uint32_t GeneDictionary::intern(const std::string& name) {
        if (frozen_) {
            throw std::logic_error("GeneDictionary::intern after freeze: " + name);
        }

        auto it = index_.find(name);
        if (it != index_.end()) return it->second;

        if (names_.size() >= (size_t)std::numeric_limits<uint32_t>::max()) {
            throw std::length_error("GeneDictionary: gene index space exhausted");
        }

        const uint32_t idx = (uint32_t)names_.size();
        names_.push_back(name);
        index_.emplace(name, idx);
        return idx;
    }

    const std::string& GeneDictionary::lookup(uint32_t index) const {
        if (index >= names_.size()) {
            throw std::out_of_range("GeneDictionary::lookup: index " + std::to_string(index)
                + " >= size " + std::to_string(names_.size()));
        }
        return names_[index];
    }

    bool GeneDictionary::find(const std::string& name, uint32_t& index) const {
        auto it = index_.find(name);
        if (it == index_.end()) return false;
        index = it->second;
        return true;
    }

} // namespace gem2bgef
