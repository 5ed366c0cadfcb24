#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

extern "C" {
#include <zlib.h>
}

namespace gem2bgef {

    // Forward-only sequence of text lines. Not restartable.
    class LineSource {
    public:
        virtual ~LineSource() = default;

        // Read one line (without trailing '\n') into `line`. Returns false on EOF.
        virtual bool readline(std::string& line) = 0;

        // Human-readable origin for messages.
        virtual std::string name() const = 0;
    };

    // Plain or gzip text file. zlib reads uncompressed files through the same
    // handle, so both go through gzopen.
    class GzLineSource : public LineSource {
    public:
        static constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;  // 4 MB

        // Throws ConfigError if the file cannot be opened.
        explicit GzLineSource(const std::string& path);
        ~GzLineSource() override;

        GzLineSource(const GzLineSource&) = delete;
        GzLineSource& operator=(const GzLineSource&) = delete;

        // Lines are split on '\n' only; embedded NUL bytes stay in the line.
        // Throws InputError on a decompression error.
        bool readline(std::string& line) override;
        std::string name() const override { return path_; }

    private:
        // Refill buf_ from the stream. Returns false at end of input.
        bool fill();

        std::string path_;
        gzFile gz_ = nullptr;
        std::vector<char> buf_;
        size_t pos_ = 0;   // next unread byte in buf_
        size_t len_ = 0;   // bytes filled in buf_
    };

    // Lines held in memory (tests, small inputs).
    class VectorLineSource : public LineSource {
    public:
        explicit VectorLineSource(std::vector<std::string> lines, std::string name = "<memory>")
            : lines_(std::move(lines)), name_(std::move(name)) {}

        bool readline(std::string& line) override {
            if (pos_ >= lines_.size()) return false;
            line = lines_[pos_++];
            return true;
        }
        std::string name() const override { return name_; }

    private:
        std::vector<std::string> lines_;
        std::string name_;
        size_t pos_ = 0;
    };

} // namespace gem2bgef
