/**
 * @file io_util.h
 * @brief Byte sources the scanner pulls its input from.
 *
 * The scanner only needs sequential forward reads and an end-of-stream
 * signal, so files, pipes and in-memory buffers all sit behind the same
 * ByteSource interface. No source ever holds more than one read's worth of
 * data on behalf of the scanner.
 *
 * @note Read failures are reported through ReadResult rather than thrown, so
 *       the validator can turn them into a fatal IO_ERROR defect and still
 *       return everything found up to that point.
 */

#ifndef CSVLINT_IO_UTIL_H
#define CSVLINT_IO_UTIL_H

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <istream>
#include <string>
#include <string_view>
#include <utility>

namespace csvlint {

/**
 * @brief Outcome of a single ByteSource::read() call.
 *
 * bytes == 0 without error means the source is exhausted.
 */
struct ReadResult {
    size_t bytes = 0;
    bool error = false;
    std::string message;  ///< Set when error is true

    static ReadResult ok(size_t n) { return ReadResult{n, false, std::string()}; }
    static ReadResult end() { return ReadResult{0, false, std::string()}; }
    static ReadResult failure(const std::string& msg) { return ReadResult{0, true, msg}; }

    bool at_end() const { return bytes == 0 && !error; }
};

/**
 * @brief Abstract readable byte source.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to capacity bytes into dst.
     *
     * May return fewer bytes than requested at any time; only a result with
     * zero bytes and no error signals end of stream.
     */
    virtual ReadResult read(uint8_t* dst, size_t capacity) = 0;

    /// Name used in I/O error messages.
    virtual std::string name() const { return "<input>"; }
};

/**
 * @brief Reads a file, or standard input when the path is "-".
 *
 * @throws std::runtime_error If the file cannot be opened.
 */
class FileSource : public ByteSource {
public:
    explicit FileSource(const std::string& path);
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    ReadResult read(uint8_t* dst, size_t capacity) override;
    std::string name() const override { return path_; }

    bool is_stdin() const { return owns_ == false; }

private:
    std::string path_;
    std::FILE* fp_ = nullptr;
    bool owns_ = true;
};

/**
 * @brief Reads from a std::istream opened by the caller.
 */
class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& input, std::string name = "<stream>")
        : input_(input), name_(std::move(name)) {}

    ReadResult read(uint8_t* dst, size_t capacity) override;
    std::string name() const override { return name_; }

private:
    std::istream& input_;
    std::string name_;
};

/**
 * @brief Serves an in-memory buffer. The buffer must outlive the source.
 *
 * max_read caps the bytes handed out per call (0 = no cap), which lets tests
 * put read boundaries at every byte.
 */
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::string_view data, size_t max_read = 0)
        : data_(data), max_read_(max_read) {}

    MemorySource(const uint8_t* data, size_t len, size_t max_read = 0)
        : data_(reinterpret_cast<const char*>(data), len), max_read_(max_read) {}

    ReadResult read(uint8_t* dst, size_t capacity) override;
    std::string name() const override { return "<memory>"; }

    size_t remaining() const { return data_.size() - pos_; }

private:
    std::string_view data_;
    size_t max_read_;
    size_t pos_ = 0;
};

}  // namespace csvlint

#endif  // CSVLINT_IO_UTIL_H
