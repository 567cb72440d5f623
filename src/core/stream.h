#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
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
// DataStream -- byte buffer with an append end and a read cursor
// ---------------------------------------------------------------------------
// Encodes transactions, headers and wallet store records.  Reading past
// the end throws std::runtime_error; decoders catch it at the record
// boundary and report a parse or corruption error.
// ---------------------------------------------------------------------------
class DataStream {
public:
    DataStream() = default;

    explicit DataStream(std::vector<uint8_t> data)
        : buf_(std::move(data)) {}

    explicit DataStream(std::span<const uint8_t> data)
        : buf_(data.begin(), data.end()) {}

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    void read(std::span<uint8_t> out) {
        if (out.size() > remaining()) {
            throw std::runtime_error("DataStream: read past end");
        }
        std::memcpy(out.data(), buf_.data() + pos_, out.size());
        pos_ += out.size();
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] size_t remaining() const noexcept { return buf_.size() - pos_; }

    /// True once every byte has been consumed.
    [[nodiscard]] bool eof() const noexcept { return pos_ >= buf_.size(); }

    /// Hand the encoded bytes to the caller and reset the stream.
    [[nodiscard]] std::vector<uint8_t> release() {
        pos_ = 0;
        return std::move(buf_);
    }

private:
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
};

}  // namespace core
