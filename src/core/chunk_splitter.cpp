/**
 * @file chunk_splitter.cpp
 * @brief Implementation of sequential chunk reading
 */

#include <kcenon/file_delivery/core/chunk_splitter.h>

#include <algorithm>

namespace kcenon::file_delivery {

// chunk_iterator implementation

chunk_splitter::chunk_iterator::chunk_iterator(
    std::ifstream file,
    std::size_t chunk_size,
    uint64_t file_size,
    uint64_t total_chunks)
    : file_(std::move(file)),
      chunk_size_(chunk_size),
      file_size_(file_size),
      total_chunks_(total_chunks),
      current_index_(0) {}

chunk_splitter::chunk_iterator::chunk_iterator(chunk_iterator&& other) noexcept
    : file_(std::move(other.file_)),
      chunk_size_(other.chunk_size_),
      file_size_(other.file_size_),
      total_chunks_(other.total_chunks_),
      current_index_(other.current_index_) {
    other.total_chunks_ = 0;
    other.current_index_ = 0;
}

auto chunk_splitter::chunk_iterator::operator=(chunk_iterator&& other) noexcept
    -> chunk_iterator& {
    if (this != &other) {
        file_ = std::move(other.file_);
        chunk_size_ = other.chunk_size_;
        file_size_ = other.file_size_;
        total_chunks_ = other.total_chunks_;
        current_index_ = other.current_index_;

        other.total_chunks_ = 0;
        other.current_index_ = 0;
    }
    return *this;
}

chunk_splitter::chunk_iterator::~chunk_iterator() = default;

auto chunk_splitter::chunk_iterator::has_next() const -> bool {
    return current_index_ < total_chunks_;
}

auto chunk_splitter::chunk_iterator::next() -> result<file_chunk> {
    if (!has_next()) {
        return unexpected(error{error_code::internal_error, "no more chunks available"});
    }

    if (!file_.good()) {
        return unexpected(error{error_code::file_read_error, "file stream error"});
    }

    uint64_t offset = current_index_ * chunk_size_;
    auto bytes_to_read = static_cast<std::size_t>(
        std::min<uint64_t>(chunk_size_, file_size_ - offset));

    file_chunk c;
    c.index = current_index_;
    c.total_chunks = total_chunks_;
    c.offset = offset;
    c.data.resize(bytes_to_read);

    file_.read(reinterpret_cast<char*>(c.data.data()), static_cast<std::streamsize>(bytes_to_read));
    if (static_cast<std::size_t>(file_.gcount()) != bytes_to_read) {
        return unexpected(
            error{error_code::file_read_error, "failed to read expected bytes"});
    }

    ++current_index_;
    return c;
}

auto chunk_splitter::chunk_iterator::current_index() const -> uint64_t {
    return current_index_;
}

auto chunk_splitter::chunk_iterator::total_chunks() const -> uint64_t {
    return total_chunks_;
}

auto chunk_splitter::chunk_iterator::file_size() const -> uint64_t {
    return file_size_;
}

// chunk_splitter implementation

chunk_splitter::chunk_splitter() : config_() {}

chunk_splitter::chunk_splitter(const chunk_config& config) : config_(config) {}

auto chunk_splitter::split(const std::filesystem::path& file_path) -> result<chunk_iterator> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    std::error_code ec;
    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return unexpected(
            error{error_code::file_not_found, "cannot get file size: " + file_path.string()});
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_access_denied, "cannot open file: " + file_path.string()});
    }

    // An empty file still yields one (empty) chunk.
    uint64_t total_chunks = config_.calculate_chunk_count(file_size);
    if (total_chunks == 0) {
        total_chunks = 1;
    }

    return chunk_iterator(std::move(file), config_.chunk_size, file_size, total_chunks);
}

auto chunk_splitter::config() const -> const chunk_config& {
    return config_;
}

}  // namespace kcenon::file_delivery
