// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/fs.h"
#include "core/logging.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

namespace core {

namespace {

std::string_view trim(std::string_view sv) {
    auto space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!sv.empty() && space(sv.front())) sv.remove_prefix(1);
    while (!sv.empty() && space(sv.back())) sv.remove_suffix(1);
    return sv;
}

std::string lower(std::string_view sv) {
    std::string out(sv);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Splits "key=value" (or a bare "key") and appends it to |target|.
void add_entry(std::unordered_map<std::string, std::vector<std::string>>& target,
               std::string_view entry) {
    auto eq = entry.find('=');
    std::string key(trim(entry.substr(0, eq)));
    std::string value = eq == std::string_view::npos
        ? std::string("1")
        : std::string(trim(entry.substr(eq + 1)));
    target[key].push_back(std::move(value));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Sources
// ---------------------------------------------------------------------------

void Config::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;
        if (arg.front() != '-') {
            positionals_.emplace_back(arg);
            continue;
        }
        arg.remove_prefix(arg.starts_with("--") ? 2 : 1);
        add_entry(cli_values_, arg);
    }
}

core::Result<void> Config::parse_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return core::Error(core::ErrorCode::STORAGE_NOT_FOUND,
                           "cannot open " + path.string());
    }
    LOG_INFO(core::LogCategory::NONE, "config: reading " + path.string());

    ValueMap parsed;
    std::string line;
    for (int line_num = 1; std::getline(in, line); ++line_num) {
        std::string_view sv = trim(line);
        if (sv.empty() || sv.front() == '#') continue;
        if (trim(sv.substr(0, sv.find('='))).empty()) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               path.string() + ":" + std::to_string(line_num) +
                               ": empty key");
        }
        add_entry(parsed, sv);
    }

    // Nothing from a malformed file is applied.
    for (auto& [key, values] : parsed) {
        auto& slot = file_values_[key];
        slot.insert(slot.end(), values.begin(), values.end());
    }
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

const std::vector<std::string>* Config::lookup(std::string_view key) const {
    std::string k{key};
    for (const ValueMap* map : {&cli_values_, &file_values_}) {
        if (auto it = map->find(k); it != map->end() && !it->second.empty()) {
            return &it->second;
        }
    }
    return nullptr;
}

void Config::set(std::string_view key, std::string value) {
    file_values_[std::string(key)] = {std::move(value)};
}

std::optional<std::string> Config::get(std::string_view key) const {
    if (const auto* values = lookup(key)) return values->front();
    return std::nullopt;
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    return get(key).value_or(std::string(default_val));
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    static constexpr std::array<std::string_view, 4> TRUE_WORDS{"1", "true", "yes", "on"};
    static constexpr std::array<std::string_view, 4> FALSE_WORDS{"0", "false", "no", "off"};

    auto value = get(key);
    if (!value) return default_val;
    std::string word = lower(*value);
    if (std::find(TRUE_WORDS.begin(), TRUE_WORDS.end(), word) != TRUE_WORDS.end()) {
        return true;
    }
    if (std::find(FALSE_WORDS.begin(), FALSE_WORDS.end(), word) != FALSE_WORDS.end()) {
        return false;
    }
    LOG_WARN(core::LogCategory::NONE,
             "config: ignoring non-boolean -" + std::string(key) + "=" + *value);
    return default_val;
}

std::vector<std::string> Config::get_list(std::string_view key) const {
    std::string k{key};
    std::vector<std::string> out;
    for (const ValueMap* map : {&cli_values_, &file_values_}) {
        if (auto it = map->find(k); it != map->end()) {
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }
    return out;
}

bool Config::has(std::string_view key) const {
    return lookup(key) != nullptr;
}

// ---------------------------------------------------------------------------
// Derived settings
// ---------------------------------------------------------------------------

std::filesystem::path Config::data_dir() const {
    auto custom = get(CONF_DATADIR);
    std::filesystem::path base = custom && !custom->empty()
        ? std::filesystem::path(*custom)
        : core::fs::get_default_data_dir();

    std::string net = network();
    if (net != "liquid") base /= net;
    return base;
}

std::string Config::network() const {
    if (auto net = get(CONF_NETWORK); net && !net->empty()) return *net;
    if (get_bool(CONF_REGTEST)) return "elementsregtest";
    if (get_bool(CONF_TESTNET)) return "liquidtestnet";
    return "liquid";
}

} // namespace core
