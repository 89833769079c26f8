//
// Created by cv2 on 14.01.2026.
//

#include "byte_stream.hpp"
#include <algorithm>
#include <cstring>

namespace comb {

namespace {

    class FileStream : public ByteStream {
    public:
        explicit FileStream(std::ifstream file) : file_(std::move(file)) {}

        std::expected<size_t, IoError> read(uint8_t* buffer, size_t max_len) override {
            if (max_len == 0) return 0;
            file_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_len));
            auto got = file_.gcount();
            if (file_.bad()) return std::unexpected(IoError::ReadFailed);
            return static_cast<size_t>(got);
        }

    private:
        std::ifstream file_;
    };

    class MemoryStream : public ByteStream {
    public:
        explicit MemoryStream(std::shared_ptr<const std::vector<uint8_t>> data) : data_(std::move(data)) {}

        std::expected<size_t, IoError> read(uint8_t* buffer, size_t max_len) override {
            size_t left = data_->size() - pos_;
            size_t n = std::min(left, max_len);
            if (n > 0) std::memcpy(buffer, data_->data() + pos_, n);
            pos_ += n;
            return n;
        }

    private:
        std::shared_ptr<const std::vector<uint8_t>> data_;
        size_t pos_ = 0;
    };

} // namespace

// --- FileSource ---

FileSource::FileSource(std::filesystem::path path) : path_(std::move(path)) {}

std::unique_ptr<ByteStream> FileSource::open() {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) return nullptr;
    return std::make_unique<FileStream>(std::move(file));
}

// --- FileSink ---

FileSink::FileSink(const std::filesystem::path& path, uint64_t offset) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    // fstream in/out refuses to create a missing file, so touch it first
    if (!std::filesystem::exists(path)) {
        std::ofstream touch(path, std::ios::binary);
    }

    file_.open(path, std::ios::binary | std::ios::in | std::ios::out);
    if (file_.is_open()) file_.seekp(static_cast<std::streamoff>(offset));
}

std::expected<void, IoError> FileSink::write(const uint8_t* data, size_t len) {
    if (!file_.is_open()) return std::unexpected(IoError::WriteFailed);
    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!file_) return std::unexpected(IoError::WriteFailed);
    return {};
}

std::expected<void, IoError> FileSink::flush() {
    if (!file_.is_open()) return std::unexpected(IoError::WriteFailed);
    file_.flush();
    if (!file_) return std::unexpected(IoError::WriteFailed);
    return {};
}

// --- Memory ---

MemorySource::MemorySource(std::string name, std::vector<uint8_t> data)
    : name_(std::move(name)), data_(std::make_shared<const std::vector<uint8_t>>(std::move(data))) {}

std::unique_ptr<ByteStream> MemorySource::open() {
    return std::make_unique<MemoryStream>(data_);
}

std::expected<void, IoError> VectorSink::write(const uint8_t* data, size_t len) {
    bytes_.insert(bytes_.end(), data, data + len);
    return {};
}

std::expected<void, IoError> VectorSink::flush() {
    ++flushes_;
    return {};
}

} // namespace comb
