#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CTW_RPC_JSON_H
#define CTW_RPC_JSON_H

#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rpc {

// JSON documents exchanged with Electrum servers and elementsd, and the
// CLI's output. Typed getters throw std::runtime_error on a mismatch;
// code reading server replies catches that where the reply enters and
// reports it as a core::Error.

struct NullValue {
    friend bool operator==(NullValue, NullValue) { return true; }
};

class JsonValue {
public:
    using Array = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

    // Implicit so replies and requests can be built from plain literals.
    // Integers of every width land in the int64_t slot.
    JsonValue() = default;
    JsonValue(std::nullptr_t) {}                                      // NOLINT
    JsonValue(bool b) : storage_(b) {}                                // NOLINT
    JsonValue(int n) : storage_(int64_t{n}) {}                        // NOLINT
    JsonValue(int64_t n) : storage_(n) {}                             // NOLINT
    JsonValue(uint32_t n) : storage_(int64_t{n}) {}                   // NOLINT
    JsonValue(uint64_t n) : storage_(static_cast<int64_t>(n)) {}      // NOLINT
    JsonValue(double d) : storage_(d) {}                              // NOLINT
    JsonValue(const char* s) : storage_(std::in_place_type<std::string>, s) {}  // NOLINT
    JsonValue(std::string s) : storage_(std::move(s)) {}              // NOLINT
    JsonValue(std::string_view s)                                     // NOLINT
        : storage_(std::in_place_type<std::string>, s) {}
    JsonValue(Array items) : storage_(std::move(items)) {}            // NOLINT
    JsonValue(Object members) : storage_(std::move(members)) {}       // NOLINT

    [[nodiscard]] bool is_null() const { return holds<NullValue>(); }
    [[nodiscard]] bool is_bool() const { return holds<bool>(); }
    [[nodiscard]] bool is_int() const { return holds<int64_t>(); }
    [[nodiscard]] bool is_double() const { return holds<double>(); }
    [[nodiscard]] bool is_string() const { return holds<std::string>(); }
    [[nodiscard]] bool is_array() const { return holds<Array>(); }
    [[nodiscard]] bool is_object() const { return holds<Object>(); }

    // Typed getters throw std::runtime_error on a mismatch. get_double()
    // also accepts an integer.
    [[nodiscard]] bool get_bool() const;
    [[nodiscard]] int64_t get_int() const;
    [[nodiscard]] double get_double() const;
    [[nodiscard]] const std::string& get_string() const;
    [[nodiscard]] const Array& get_array() const;
    [[nodiscard]] const Object& get_object() const;

    /// Object member, inserted when absent. A null value turns into an
    /// empty object first.
    JsonValue& operator[](const std::string& key);

    /// Missing members and non-objects read as null.
    const JsonValue& operator[](const std::string& key) const;

    /// Throws std::out_of_range past the end.
    const JsonValue& at(size_t index) const;

    void push_back(JsonValue val);

    [[nodiscard]] bool has_key(const std::string& key) const;
    /// Length of a string, array or object; 0 for anything else.
    [[nodiscard]] size_t size() const;

    friend bool operator==(const JsonValue& a, const JsonValue& b) {
        return a.storage_ == b.storage_;
    }

private:
    template <typename T>
    bool holds() const { return std::holds_alternative<T>(storage_); }

    std::variant<NullValue, bool, int64_t, double, std::string, Array, Object>
        storage_;
};

inline constexpr int MAX_JSON_DEPTH = 64;

/// Throws std::runtime_error on malformed input or trailing content.
JsonValue parse_json(std::string_view input);

/// parse_json with failures reported as PARSE_BAD_FORMAT.
core::Result<JsonValue> try_parse_json(std::string_view input);

std::string json_serialize(const JsonValue& val);

/// Multi-line form for the CLI, ending in a newline.
std::string json_serialize_pretty(const JsonValue& val, int indent = 2);

} // namespace rpc

#endif // CTW_RPC_JSON_H
