#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace archivedir::filestream {

constexpr std::size_t kDefaultChunkSize = 65536;  // 64KB chunks

// Sequential binary reader; never seeks after open.
class FileReader {
public:
    explicit FileReader(const std::filesystem::path& path)
        : path_(path), input_(path, std::ios::binary) {
        if (!input_) {
            throw std::runtime_error("Failed to open file for reading: " + path.string());
        }
    }

    // Returns 0 at end of file.
    std::size_t Read(std::uint8_t* buffer, std::size_t max_size) {
        if (max_size == 0 || input_.eof()) {
            return 0;
        }
        input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_size));
        if (input_.bad()) {
            throw std::runtime_error("Failed to read file: " + path_.string());
        }
        std::size_t bytes_read = static_cast<std::size_t>(input_.gcount());
        bytes_read_ += bytes_read;
        return bytes_read;
    }

    std::uint64_t BytesRead() const noexcept { return bytes_read_; }
    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::uint64_t bytes_read_ = 0;
};

// Buffered binary writer. Close() must be called to flush; a writer destroyed
// without Close() leaves a possibly short file behind, which callers delete.
class FileWriter {
public:
    explicit FileWriter(const std::filesystem::path& path, std::size_t buffer_size = kDefaultChunkSize)
        : path_(path), output_(path, std::ios::binary | std::ios::trunc), chunk_(std::max<std::size_t>(buffer_size, 1)) {
        if (!output_) {
            throw std::runtime_error("Failed to open file for writing: " + path.string());
        }
    }

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    void Write(const std::uint8_t* data, std::size_t size) {
        std::size_t offset = 0;
        while (offset < size) {
            std::size_t available = chunk_.size() - buffer_pos_;
            std::size_t to_copy = std::min(available, size - offset);
            std::memcpy(chunk_.data() + buffer_pos_, data + offset, to_copy);
            buffer_pos_ += to_copy;
            offset += to_copy;
            if (buffer_pos_ == chunk_.size()) {
                FlushBuffer();
            }
        }
        bytes_written_ += size;
    }

    void Close() {
        if (closed_) {
            return;
        }
        FlushBuffer();
        output_.flush();
        output_.close();
        closed_ = true;
        if (output_.fail()) {
            throw std::runtime_error("Failed to finish writing file: " + path_.string());
        }
    }

    std::uint64_t BytesWritten() const noexcept { return bytes_written_; }
    const std::filesystem::path& path() const noexcept { return path_; }

private:
    void FlushBuffer() {
        if (buffer_pos_ == 0) {
            return;
        }
        output_.write(reinterpret_cast<const char*>(chunk_.data()), static_cast<std::streamsize>(buffer_pos_));
        if (!output_) {
            throw std::runtime_error("Failed to write to file: " + path_.string());
        }
        buffer_pos_ = 0;
    }

    std::filesystem::path path_;
    std::ofstream output_;
    std::vector<std::uint8_t> chunk_;
    std::size_t buffer_pos_ = 0;
    std::uint64_t bytes_written_ = 0;
    bool closed_ = false;
};

}  // namespace archivedir::filestream
