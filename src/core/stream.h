#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// DataStream -- append-only write stream backed by std::vector<uint8_t>
// ---------------------------------------------------------------------------
class DataStream {
public:
    DataStream() = default;

    explicit DataStream(std::vector<uint8_t> data)
        : buf_(std::move(data)) {}

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    /// Overwrite bytes already written at @p pos (used for back-patching
    /// length fields).
    void patch(size_t pos, std::span<const uint8_t> data) {
        if (pos + data.size() > buf_.size()) {
            throw std::runtime_error(
                "DataStream::patch(): attempted write past end of stream");
        }
        std::memcpy(buf_.data() + pos, data.data(), data.size());
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] bool empty() const noexcept { return buf_.empty(); }

    [[nodiscard]] const uint8_t* data() const noexcept {
        return buf_.data();
    }

    [[nodiscard]] std::span<const uint8_t> view() const noexcept {
        return std::span<const uint8_t>(buf_.data(), buf_.size());
    }

    /// Move the internal buffer out.  Resets the stream to empty state.
    [[nodiscard]] std::vector<uint8_t> release() {
        return std::move(buf_);
    }

    void reserve(size_t n) { buf_.reserve(n); }

private:
    std::vector<uint8_t> buf_;
};

// ---------------------------------------------------------------------------
// SpanReader -- read-only stream over an existing byte span (zero-copy)
// ---------------------------------------------------------------------------
// The cursor can be repositioned with seek(), which the DNS name decoder
// needs to follow compression pointers.
// ---------------------------------------------------------------------------
class SpanReader {
public:
    explicit SpanReader(std::span<const uint8_t> data)
        : data_(data) {}

    void read(std::span<uint8_t> buf) {
        if (pos_ + buf.size() > data_.size()) {
            throw std::runtime_error(
                "SpanReader::read(): attempted read past end of span");
        }
        std::memcpy(buf.data(), data_.data() + pos_, buf.size());
        pos_ += buf.size();
    }

    void skip(size_t n) {
        if (pos_ + n > data_.size()) {
            throw std::runtime_error(
                "SpanReader::skip(): attempted skip past end of span");
        }
        pos_ += n;
    }

    void seek(size_t pos) {
        if (pos > data_.size()) {
            throw std::runtime_error(
                "SpanReader::seek(): position past end of span");
        }
        pos_ = pos;
    }

    [[nodiscard]] size_t tell() const noexcept { return pos_; }

    [[nodiscard]] size_t remaining() const noexcept {
        return data_.size() - pos_;
    }

    [[nodiscard]] bool eof() const noexcept {
        return pos_ >= data_.size();
    }

    /// The whole underlying span, independent of the cursor.
    [[nodiscard]] std::span<const uint8_t> source() const noexcept {
        return data_;
    }

private:
    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

}  // namespace core
