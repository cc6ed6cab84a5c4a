#include "archivedir/byte_pipe.hpp"

#include "archivedir/errors.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace archivedir::stream {

BytePipe::BytePipe(std::string name, std::size_t capacity)
    : name_(std::move(name)), capacity_(capacity == 0 ? 1 : capacity) {}

void BytePipe::Write(const std::uint8_t* data, std::size_t len) {
    while (len > 0) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return aborted_ || closed_ || buffered_ < capacity_; });
        if (aborted_) {
            throw archivedir::Cancelled(name_);
        }
        if (closed_) {
            throw std::logic_error("write to closed pipe " + name_);
        }
        std::size_t take = std::min(len, capacity_ - buffered_);
        chunks_.emplace_back(data, data + take);
        buffered_ += take;
        bytes_written_ += take;
        data += take;
        len -= take;
        lock.unlock();
        not_empty_.notify_one();
    }
}

std::size_t BytePipe::Read(std::uint8_t* out, std::size_t max) {
    if (max == 0) {
        return 0;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return aborted_ || closed_ || buffered_ > 0; });
    if (aborted_) {
        throw archivedir::Cancelled(name_);
    }
    std::size_t copied = 0;
    while (copied < max && !chunks_.empty()) {
        Bytes& front = chunks_.front();
        std::size_t take = std::min(max - copied, front.size() - front_offset_);
        std::memcpy(out + copied, front.data() + front_offset_, take);
        copied += take;
        front_offset_ += take;
        if (front_offset_ == front.size()) {
            chunks_.pop_front();
            front_offset_ = 0;
        }
    }
    buffered_ -= copied;
    bytes_read_ += copied;
    lock.unlock();
    if (copied > 0) {
        not_full_.notify_one();
    }
    return copied;
}

void BytePipe::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void BytePipe::Abort() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
        chunks_.clear();
        front_offset_ = 0;
        buffered_ = 0;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

std::uint64_t BytePipe::bytes_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_written_;
}

std::uint64_t BytePipe::bytes_read() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_read_;
}

}  // namespace archivedir::stream
