#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace gem2bgef {

	// Gene name -> dense index in first-seen order.
	// Single writer. After freeze() the index set is fixed and every intern()
	// throws std::logic_error, known name or not; resolve names with find().
	class GeneDictionary {
	public:
		uint32_t intern(const std::string& name);

		void freeze() { frozen_ = true; }
		bool is_frozen() const { return frozen_; }

		const std::string& lookup(uint32_t index) const;

		// Returns false if the name was never interned.
		bool find(const std::string& name, uint32_t& index) const;

		uint32_t size() const { return (uint32_t)names_.size(); }
		const std::vector<std::string>& names() const { return names_; }

	private:
		std::unordered_map<std::string, uint32_t> index_;
		std::vector<std::string> names_;
		bool frozen_ = false;
	};

} // namespace gem2bgef
