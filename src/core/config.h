#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Common configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_DATADIR        = "datadir";
inline constexpr const char* CONF_CONF           = "conf";
inline constexpr const char* CONF_NETWORK        = "network";
inline constexpr const char* CONF_TESTNET        = "testnet";
inline constexpr const char* CONF_REGTEST        = "regtest";
inline constexpr const char* CONF_DESCRIPTOR     = "descriptor";
inline constexpr const char* CONF_ELECTRUM       = "electrum";
inline constexpr const char* CONF_TLS            = "tls";
inline constexpr const char* CONF_VALIDATEDOMAIN = "validatedomain";
inline constexpr const char* CONF_GAPLIMIT       = "gaplimit";
inline constexpr const char* CONF_HEADERWINDOW   = "headerwindow";
inline constexpr const char* CONF_TIMEOUT        = "timeout";
inline constexpr const char* CONF_RPCCONNECT     = "rpcconnect";
inline constexpr const char* CONF_RPCPORT        = "rpcport";
inline constexpr const char* CONF_RPCUSER        = "rpcuser";
inline constexpr const char* CONF_RPCPASSWORD    = "rpcpassword";
inline constexpr const char* CONF_LOGLEVEL       = "loglevel";
inline constexpr const char* CONF_DEBUG          = "debug";
inline constexpr const char* CONF_PRINTTOCONSOLE = "printtoconsole";

// ---------------------------------------------------------------------------
// Config -- wallet settings from the command line and ctwallet.conf
//
// Command-line values shadow file values, which shadow set(). A key given
// several times (-debug=sync -debug=store) keeps every value for
// get_list(). Arguments that do not start with '-' are positionals: the
// CLI command and its operands.
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// -key=value, --key=value, or a bare -flag (value "1"). argv[0] is
    /// skipped.
    void parse_args(int argc, char* argv[]);

    [[nodiscard]] const std::vector<std::string>& positionals() const {
        return positionals_;
    }

    /// key=value lines; '#' starts a comment line and a bare word is a
    /// flag. Fails with STORAGE_NOT_FOUND if the file cannot be opened and
    /// PARSE_BAD_FORMAT on a line with an empty key.
    core::Result<void> parse_file(const std::filesystem::path& path);

    /// Programmatic value, replacing earlier set() or file values.
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// 1/true/yes/on and 0/false/no/off, any case. Anything else, or an
    /// absent key, yields @p default_val.
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Every value for @p key, command-line values first.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    /// -datadir, else the platform default; networks other than liquid
    /// get a subdirectory of their own.
    [[nodiscard]] std::filesystem::path data_dir() const;

    /// -network, else elementsregtest for -regtest, liquidtestnet for
    /// -testnet, else liquid. Not validated here.
    [[nodiscard]] std::string network() const;

private:
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;

    ValueMap cli_values_;
    ValueMap file_values_;
    std::vector<std::string> positionals_;
};

} // namespace core
