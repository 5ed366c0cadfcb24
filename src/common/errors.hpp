#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace gem2bgef {

	// A malformed GEM row. Recoverable: the run skips it and counts it.
	struct LineError {
		uint64_t line_no = 0;   // 1-based, counted over the whole stream
		std::string raw;        // line content without the trailing newline
		std::string reason;
	};

	// Invalid bin list, bad config file, unreadable input path ...
	// Raised before any record is processed.
	class ConfigError : public std::runtime_error {
	public:
		explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
	};

	// Input stream is unusable as a whole (no header, bad metadata,
	// too many consecutive bad rows, no valid records).
	class InputError : public std::runtime_error {
	public:
		explicit InputError(const std::string& msg) : std::runtime_error(msg) {}
	};

	// Internal consistency violation; the run must stop instead of
	// emitting a corrupted matrix.
	class InvariantError : public std::runtime_error {
	public:
		explicit InvariantError(const std::string& msg) : std::runtime_error(msg) {}
	};

	class EmptyExtentError : public InvariantError {
	public:
		explicit EmptyExtentError(const std::string& msg) : InvariantError(msg) {}
	};

	// Failure to create or commit the output container.
	class AssemblyError : public std::runtime_error {
	public:
		explicit AssemblyError(const std::string& msg) : std::runtime_error(msg) {}
	};

} // namespace gem2bgef
