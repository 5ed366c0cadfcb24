#include "io/line_source.hpp"

#include <algorithm>
#include <climits>
#include <cstring>
#include "common/errors.hpp"

namespace gem2bgef {

    GzLineSource::GzLineSource(const std::string& path)
        : path_(path), buf_(256 * 1024) {
        gz_ = gzopen(path.c_str(), "rb");
        if (!gz_) throw ConfigError("Could not open input: " + path);
        gzbuffer(gz_, GZBUF_SIZE);
    }

    GzLineSource::~GzLineSource() {
        if (gz_) gzclose(gz_);
    }

    bool GzLineSource::fill() {
        const unsigned want = (unsigned)std::min<size_t>(buf_.size(), (size_t)INT_MAX);
        const int n = gzread(gz_, buf_.data(), want);
        if (n < 0) {
            int errnum = Z_OK;
            const char* msg = gzerror(gz_, &errnum);
            throw InputError("Read error in " + path_ + ": " + (msg ? msg : "zlib error"));
        }
        pos_ = 0;
        len_ = (size_t)n;
        return n > 0;
    }

    bool GzLineSource::readline(std::string& line) {
        line.clear();
        bool got_any = false;

        // Scan by length, not by strlen, so a NUL byte cannot end a line early.
        while (pos_ < len_ || fill()) {
            got_any = true;
            const char* start = buf_.data() + pos_;
            const size_t avail = len_ - pos_;
            const void* nl = std::memchr(start, '\n', avail);
            if (nl) {
                const size_t n = (size_t)(static_cast<const char*>(nl) - start);
                line.append(start, n);
                pos_ += n + 1;
                return true;
            }
            line.append(start, avail);
            pos_ = len_;
        }
        return got_any;  // last line without a newline
    }

} // namespace gem2bgef
