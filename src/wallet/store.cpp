// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/store.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"

#include <charconv>
#include <exception>
#include <stdexcept>

namespace wallet {

// ---------------------------------------------------------------------------
// Record keys and value encodings
// ---------------------------------------------------------------------------

namespace {

constexpr std::string_view KEY_TIP = "tip";
constexpr std::string_view KEY_LAST_INDEX = "last_index";
constexpr std::string_view PREFIX_TX = "tx:";
constexpr std::string_view PREFIX_HEIGHT = "height:";
constexpr std::string_view PREFIX_UNBLINDED = "unblinded:";
constexpr std::string_view PREFIX_STATUS = "status:";
constexpr std::string_view PREFIX_HEADER = "header:";
constexpr std::string_view PREFIX_SCRIPT = "script:";

std::vector<uint8_t> encode_tip(const ChainTip& tip) {
    core::DataStream s;
    core::ser_write_u32(s, tip.height);
    core::ser_write_uint256(s, tip.hash);
    core::ser_write_u32(s, tip.timestamp);
    return s.release();
}

ChainTip decode_tip(core::DataStream& s) {
    ChainTip tip;
    tip.height = core::ser_read_u32(s);
    tip.hash = core::ser_read_uint256(s);
    tip.timestamp = core::ser_read_u32(s);
    return tip;
}

std::vector<uint8_t> encode_u32(uint32_t v) {
    core::DataStream s;
    core::ser_write_u32(s, v);
    return s.release();
}

std::vector<uint8_t> encode_height(const std::optional<uint32_t>& h) {
    core::DataStream s;
    core::ser_write_bool(s, h.has_value());
    core::ser_write_u32(s, h.value_or(0));
    return s.release();
}

std::optional<uint32_t> decode_height(core::DataStream& s) {
    bool confirmed = core::ser_read_bool(s);
    uint32_t h = core::ser_read_u32(s);
    if (!confirmed) return std::nullopt;
    return h;
}

std::vector<uint8_t> encode_secrets(const crypto::TxOutSecrets& sec) {
    core::DataStream s;
    core::ser_write_uint256(s, sec.asset);
    core::ser_write_u64(s, sec.value);
    core::ser_write_uint256(s, sec.asset_bf);
    core::ser_write_uint256(s, sec.value_bf);
    return s.release();
}

crypto::TxOutSecrets decode_secrets(core::DataStream& s) {
    crypto::TxOutSecrets sec;
    sec.asset = core::ser_read_uint256(s);
    sec.value = core::ser_read_u64(s);
    sec.asset_bf = core::ser_read_uint256(s);
    sec.value_bf = core::ser_read_uint256(s);
    return sec;
}

std::vector<uint8_t> encode_header(const HeaderInfo& h) {
    core::DataStream s;
    core::ser_write_uint256(s, h.hash);
    core::ser_write_u32(s, h.timestamp);
    return s.release();
}

HeaderInfo decode_header(core::DataStream& s) {
    HeaderInfo h;
    h.hash = core::ser_read_uint256(s);
    h.timestamp = core::ser_read_u32(s);
    return h;
}

std::vector<uint8_t> to_bytes(std::string_view str) {
    return std::vector<uint8_t>(str.begin(), str.end());
}

// Heights are zero-padded so the records sort numerically.
std::string height_key(uint32_t height) {
    std::string digits = std::to_string(height);
    return std::string(PREFIX_HEADER) +
           std::string(10 - digits.size(), '0') + digits;
}

std::string unblinded_key(const primitives::OutPoint& op) {
    return std::string(PREFIX_UNBLINDED) + op.to_string();
}

uint32_t parse_u32(std::string_view text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw std::invalid_argument("bad number in record key");
    }
    return value;
}

/// Reads a whole record value, rejecting trailing bytes.
template <typename F>
auto decode_value(const std::vector<uint8_t>& bytes, F decode) {
    core::DataStream s(std::span<const uint8_t>(bytes.data(), bytes.size()));
    auto out = decode(s);
    if (!s.eof()) throw std::runtime_error("trailing bytes in record");
    return out;
}

/// Emit puts for entries that are new or changed and erases for entries
/// that disappeared.
template <typename Map, typename KeyFn, typename EncodeFn>
void diff_records(const Map& before, const Map& after, KeyFn key_of,
                  EncodeFn encode, WalletDB::Batch& batch) {
    for (const auto& [k, v] : after) {
        auto it = before.find(k);
        if (it == before.end() || !(it->second == v)) {
            batch.put(key_of(k), encode(v));
        }
    }
    for (const auto& [k, v] : before) {
        if (after.find(k) == after.end()) {
            batch.erase(key_of(k));
        }
    }
}

template <typename T, typename EncodeFn>
void diff_single(const std::optional<T>& before, const std::optional<T>& after,
                 std::string_view key, EncodeFn encode,
                 WalletDB::Batch& batch) {
    if (before == after) return;
    if (after) {
        batch.put(std::string(key), encode(*after));
    } else {
        batch.erase(std::string(key));
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Store
// ---------------------------------------------------------------------------

Store::Store(size_t header_window)
    : header_window_(header_window == 0 ? 1 : header_window),
      snapshot_(std::make_shared<const WalletCache>()) {}

core::Result<std::unique_ptr<Store>> Store::open(
    const std::filesystem::path& dir, size_t header_window) {
    std::unique_ptr<Store> store(new Store(header_window));
    store->db_ = std::make_unique<WalletDB>();
    CTW_TRY_VOID(store->db_->open(dir / "wallet.dat"));
    CTW_TRY_VOID(store->load());
    return std::move(store);
}

std::unique_ptr<Store> Store::in_memory(size_t header_window) {
    return std::unique_ptr<Store>(new Store(header_window));
}

core::Result<void> Store::load() {
    auto cache = std::make_shared<WalletCache>();

    try {
        if (db_->exists(KEY_TIP)) {
            auto bytes = CTW_TRY(db_->read(KEY_TIP));
            cache->tip = decode_value(bytes, decode_tip);
        }
        if (db_->exists(KEY_LAST_INDEX)) {
            auto bytes = CTW_TRY(db_->read(KEY_LAST_INDEX));
            cache->last_index = decode_value(bytes, [](core::DataStream& s) {
                return core::ser_read_u32(s);
            });
        }

        for (auto& [key, value] : db_->read_by_prefix(PREFIX_TX)) {
            auto txid = core::uint256::from_hex(key.substr(PREFIX_TX.size()));
            auto tx = primitives::Transaction::from_bytes(value);
            if (!tx) {
                return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                                   "bad transaction record " + key + ": " +
                                   tx.error().message());
            }
            if (tx.value().txid() != txid) {
                return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                                   "transaction record " + key +
                                   " does not match its txid");
            }
            cache->txs.emplace(txid, std::move(tx).value());
        }

        for (auto& [key, value] : db_->read_by_prefix(PREFIX_HEIGHT)) {
            auto txid =
                core::uint256::from_hex(key.substr(PREFIX_HEIGHT.size()));
            cache->heights[txid] = decode_value(value, decode_height);
        }

        for (auto& [key, value] : db_->read_by_prefix(PREFIX_UNBLINDED)) {
            std::string_view rest(key);
            rest.remove_prefix(PREFIX_UNBLINDED.size());
            auto colon = rest.find(':');
            if (colon == std::string_view::npos) {
                throw std::invalid_argument("missing output index");
            }
            primitives::OutPoint op(core::uint256::from_hex(rest.substr(0, colon)),
                                    parse_u32(rest.substr(colon + 1)));
            cache->unblinded[op] = decode_value(value, decode_secrets);
        }

        for (auto& [key, value] : db_->read_by_prefix(PREFIX_STATUS)) {
            auto script = primitives::script::Script::from_hex(
                key.substr(PREFIX_STATUS.size()));
            cache->script_status[script] =
                std::string(value.begin(), value.end());
        }

        for (auto& [key, value] : db_->read_by_prefix(PREFIX_HEADER)) {
            uint32_t height = parse_u32(
                std::string_view(key).substr(PREFIX_HEADER.size()));
            cache->headers[height] = decode_value(value, decode_header);
        }

        for (auto& [key, value] : db_->read_by_prefix(PREFIX_SCRIPT)) {
            uint32_t index = parse_u32(
                std::string_view(key).substr(PREFIX_SCRIPT.size()));
            cache->scripts[index] = primitives::script::Script(value);
        }
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                           std::string("unreadable wallet record: ") +
                           e.what());
    }

    CTW_TRY_VOID(check_invariants(*cache));

    LOG_INFO(core::LogCategory::STORE,
             "loaded wallet cache: " + std::to_string(cache->txs.size()) +
             " txs, " + std::to_string(cache->unblinded.size()) +
             " owned outputs, tip " +
             (cache->tip ? std::to_string(cache->tip->height)
                         : std::string("none")));
    publish(std::move(cache));
    return core::make_ok();
}

core::Result<std::shared_ptr<const WalletCache>> Store::read() const {
    core::SharedLock lock(snapshot_mutex_);
    if (poisoned_) {
        return core::Error(core::ErrorCode::STORAGE_POISONED,
                           "wallet store poisoned by an aborted writer");
    }
    return snapshot_;
}

core::Result<Store::WriteTxn> Store::write() {
    std::unique_lock<core::Mutex> lock(writer_mutex_);
    auto base = CTW_TRY(read());
    return WriteTxn(*this, std::move(lock), std::move(base));
}

bool Store::is_poisoned() const {
    core::SharedLock lock(snapshot_mutex_);
    return poisoned_;
}

void Store::publish(std::shared_ptr<const WalletCache> next) {
    core::ExclusiveLock lock(snapshot_mutex_);
    snapshot_ = std::move(next);
}

void Store::poison(const std::string& why) {
    LOG_ERROR(core::LogCategory::STORE, "wallet store poisoned: " + why);
    core::ExclusiveLock lock(snapshot_mutex_);
    poisoned_ = true;
}

core::Result<void> Store::persist(const WalletCache& before,
                                  const WalletCache& after) {
    if (!db_) return core::make_ok();

    WalletDB::Batch batch;
    diff_single(before.tip, after.tip, KEY_TIP, encode_tip, batch);
    diff_single(before.last_index, after.last_index, KEY_LAST_INDEX,
                encode_u32, batch);

    diff_records(before.txs, after.txs,
        [](const core::uint256& id) {
            return std::string(PREFIX_TX) + id.to_hex();
        },
        [](const primitives::Transaction& tx) { return tx.serialize(); },
        batch);
    diff_records(before.heights, after.heights,
        [](const core::uint256& id) {
            return std::string(PREFIX_HEIGHT) + id.to_hex();
        },
        encode_height, batch);
    diff_records(before.unblinded, after.unblinded, unblinded_key,
                 encode_secrets, batch);
    diff_records(before.script_status, after.script_status,
        [](const primitives::script::Script& s) {
            return std::string(PREFIX_STATUS) + s.to_hex();
        },
        [](const StatusFingerprint& st) { return to_bytes(st); },
        batch);
    diff_records(before.headers, after.headers, height_key, encode_header,
                 batch);
    diff_records(before.scripts, after.scripts,
        [](uint32_t index) {
            return std::string(PREFIX_SCRIPT) + std::to_string(index);
        },
        [](const primitives::script::Script& s) { return s.data(); },
        batch);

    return db_->apply(batch);
}

// ---------------------------------------------------------------------------
// WriteTxn
// ---------------------------------------------------------------------------

Store::WriteTxn::WriteTxn(Store& store, std::unique_lock<core::Mutex> lock,
                          std::shared_ptr<const WalletCache> base)
    : store_(&store),
      lock_(std::move(lock)),
      base_(std::move(base)),
      working_(std::make_unique<WalletCache>(*base_)),
      uncaught_on_entry_(std::uncaught_exceptions()) {}

Store::WriteTxn::WriteTxn(WriteTxn&& other) noexcept
    : store_(other.store_),
      lock_(std::move(other.lock_)),
      base_(std::move(other.base_)),
      working_(std::move(other.working_)),
      uncaught_on_entry_(other.uncaught_on_entry_),
      done_(other.done_) {
    other.done_ = true;
}

Store::WriteTxn::~WriteTxn() {
    if (!done_ && std::uncaught_exceptions() > uncaught_on_entry_) {
        store_->poison("write transaction unwound by an exception");
    }
}

core::Result<void> Store::WriteTxn::commit() {
    if (done_) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "write transaction already finished");
    }
    done_ = true;

    auto& headers = working_->headers;
    while (headers.size() > store_->header_window_) {
        headers.erase(headers.begin());
    }

    CTW_TRY_VOID(check_invariants(*working_));

    if (*working_ == *base_) {
        LOG_TRACE(core::LogCategory::STORE, "commit: nothing changed");
        return core::make_ok();
    }

    auto persisted = store_->persist(*base_, *working_);
    if (!persisted) {
        LOG_ERROR(core::LogCategory::STORE,
                  "commit failed, cache left unchanged: " +
                  persisted.error().message());
        return persisted;
    }

    std::shared_ptr<const WalletCache> next(std::move(working_));
    store_->publish(std::move(next));
    LOG_DEBUG(core::LogCategory::STORE, "commit published new snapshot");
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Invariants
// ---------------------------------------------------------------------------

core::Result<void> check_invariants(const WalletCache& cache) {
    for (const auto& [txid, height] : cache.heights) {
        if (cache.txs.find(txid) == cache.txs.end()) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                               "height entry without body: " + txid.to_hex());
        }
        if (height && (!cache.tip || *height > cache.tip->height)) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                               "confirmation above tip: " + txid.to_hex());
        }
    }
    for (const auto& [op, secrets] : cache.unblinded) {
        auto it = cache.txs.find(op.txid);
        if (it == cache.txs.end() || op.n >= it->second.vout().size()) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                               "unblinded output without body: " +
                               op.to_string());
        }
    }
    return core::make_ok();
}

} // namespace wallet
