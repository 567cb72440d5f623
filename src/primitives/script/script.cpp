// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/script/script.h"

#include <stdexcept>

#include "core/hex.h"

namespace primitives::script {

Script Script::from_hex(std::string_view hex) {
    auto bytes = core::from_hex(hex);
    if (!bytes) {
        throw std::invalid_argument("script is not valid hex");
    }
    return Script(std::move(*bytes));
}

Script Script::witness(int version, std::span<const uint8_t> program) {
    if (version < 0 || version > 16 || program.size() < 2 ||
        program.size() > 40) {
        throw std::invalid_argument("not a witness program");
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(2 + program.size());
    bytes.push_back(version == 0 ? OP_0
                                 : static_cast<uint8_t>(OP_1 + version - 1));
    bytes.push_back(static_cast<uint8_t>(program.size()));
    bytes.insert(bytes.end(), program.begin(), program.end());
    return Script(std::move(bytes));
}

std::optional<std::pair<int, std::vector<uint8_t>>>
Script::witness_program() const {
    if (bytes_.size() < 4 || bytes_.size() > 42) return std::nullopt;

    const uint8_t op = bytes_[0];
    int version;
    if (op == OP_0) {
        version = 0;
    } else if (op >= OP_1 && op <= OP_16) {
        version = op - OP_1 + 1;
    } else {
        return std::nullopt;
    }

    // A single direct push covering the rest of the script.
    if (static_cast<size_t>(bytes_[1]) + 2 != bytes_.size()) {
        return std::nullopt;
    }
    return std::pair{version, std::vector<uint8_t>(bytes_.begin() + 2,
                                                   bytes_.end())};
}

std::string Script::to_hex() const {
    return core::to_hex(bytes_);
}

} // namespace primitives::script
