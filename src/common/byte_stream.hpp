//
// Created by cv2 on 14.01.2026.
//

#pragma once
#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace comb {

    enum class IoError {
        ReadFailed,
        WriteFailed
    };

    // A sequential, forward-only view of a resource. read() returns 0 at end of data.
    class ByteStream {
    public:
        virtual ~ByteStream() = default;
        virtual std::expected<size_t, IoError> read(uint8_t* buffer, size_t max_len) = 0;
    };

    // Something that can hand out fresh streams positioned at byte 0.
    // Must support being opened several times (digest pass + transfer pass).
    class ByteSource {
    public:
        virtual ~ByteSource() = default;

        // nullptr when the resource cannot be opened
        virtual std::unique_ptr<ByteStream> open() = 0;
        virtual std::string name() const = 0;
    };

    class ByteSink {
    public:
        virtual ~ByteSink() = default;
        virtual std::expected<void, IoError> write(const uint8_t* data, size_t len) = 0;
        virtual std::expected<void, IoError> flush() = 0;
    };

    // --- File backed ---

    class FileSource : public ByteSource {
    public:
        explicit FileSource(std::filesystem::path path);

        std::unique_ptr<ByteStream> open() override;
        std::string name() const override { return path_.string(); }

    private:
        std::filesystem::path path_;
    };

    // Writes starting at a fixed absolute offset of an existing (or new) file,
    // so chunks can be written out of order.
    class FileSink : public ByteSink {
    public:
        FileSink(const std::filesystem::path& path, uint64_t offset);

        bool is_open() const { return file_.is_open(); }

        std::expected<void, IoError> write(const uint8_t* data, size_t len) override;
        std::expected<void, IoError> flush() override;

    private:
        std::fstream file_;
    };

    // --- Memory backed ---

    class MemorySource : public ByteSource {
    public:
        MemorySource(std::string name, std::vector<uint8_t> data);

        std::unique_ptr<ByteStream> open() override;
        std::string name() const override { return name_; }

    private:
        std::string name_;
        std::shared_ptr<const std::vector<uint8_t>> data_;
    };

    class VectorSink : public ByteSink {
    public:
        std::expected<void, IoError> write(const uint8_t* data, size_t len) override;
        std::expected<void, IoError> flush() override;

        const std::vector<uint8_t>& bytes() const { return bytes_; }
        size_t flush_count() const { return flushes_; }

    private:
        std::vector<uint8_t> bytes_;
        size_t flushes_ = 0;
    };

} // namespace comb
