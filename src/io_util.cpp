#include "csvlint/io_util.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace csvlint {

FileSource::FileSource(const std::string& path) : path_(path) {
    if (path == "-") {
        fp_ = stdin;
        owns_ = false;
        path_ = "<stdin>";
        return;
    }
    fp_ = std::fopen(path.c_str(), "rb");
    if (fp_ == nullptr) {
        throw std::runtime_error("could not open file '" + path + "': " + std::strerror(errno));
    }
}

FileSource::~FileSource() {
    if (fp_ != nullptr && owns_) {
        std::fclose(fp_);
    }
}

ReadResult FileSource::read(uint8_t* dst, size_t capacity) {
    size_t n = std::fread(dst, 1, capacity, fp_);
    if (n == 0 && std::ferror(fp_)) {
        return ReadResult::failure("error reading '" + path_ + "': " + std::strerror(errno));
    }
    return ReadResult::ok(n);
}

ReadResult StreamSource::read(uint8_t* dst, size_t capacity) {
    if (input_.bad()) {
        return ReadResult::failure("error reading " + name_);
    }
    if (input_.eof()) {
        return ReadResult::end();
    }
    input_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(capacity));
    std::streamsize got = input_.gcount();
    if (input_.bad()) {
        return ReadResult::failure("error reading " + name_);
    }
    return ReadResult::ok(static_cast<size_t>(got));
}

ReadResult MemorySource::read(uint8_t* dst, size_t capacity) {
    size_t n = std::min(capacity, data_.size() - pos_);
    if (max_read_ != 0) {
        n = std::min(n, max_read_);
    }
    if (n > 0) {
        std::memcpy(dst, data_.data() + pos_, n);
        pos_ += n;
    }
    return ReadResult::ok(n);
}

}  // namespace csvlint
