#include "archivedir/stream.hpp"

#include "archivedir/errors.hpp"

#include <algorithm>
#include <utility>

namespace archivedir::stream {

void CancelToken::ThrowIfCancelled(const std::string& component) const {
    if (IsCancelled()) {
        throw archivedir::Cancelled(component);
    }
}

BufferSource::BufferSource(Bytes data, std::size_t chunk_size)
    : data_(std::move(data)), chunk_size_(chunk_size == 0 ? 1 : chunk_size) {}

void BufferSource::Produce(ChunkSink& out, const CancelToken& cancel) {
    std::size_t offset = 0;
    while (offset < data_.size()) {
        cancel.ThrowIfCancelled(Name());
        std::size_t take = std::min(chunk_size_, data_.size() - offset);
        out.Write(data_.data() + offset, take);
        offset += take;
    }
}

Bytes ApplyTransform(StreamTransform& transform, const Bytes& input, std::size_t chunk_size) {
    if (chunk_size == 0) {
        chunk_size = 1;
    }
    BufferSink sink;
    std::size_t offset = 0;
    while (offset < input.size()) {
        std::size_t take = std::min(chunk_size, input.size() - offset);
        transform.Update(input.data() + offset, take, sink);
        offset += take;
    }
    transform.Finish(sink);
    return sink.Take();
}

}  // namespace archivedir::stream
