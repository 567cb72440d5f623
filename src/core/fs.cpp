// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/fs.h"

#include "core/hex.h"
#include "core/random.h"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace core::fs {

namespace {

// Closes on scope exit.
class UniqueFd {
public:
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { if (fd_ >= 0) ::close(fd_); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    /// close(2) result, which reports deferred write errors.
    bool close() {
        int fd = fd_;
        fd_ = -1;
        return fd < 0 || ::close(fd) == 0;
    }

private:
    int fd_;
};

bool write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

path temp_sibling(const path& target) {
    std::array<uint8_t, 6> nonce{};
    core::get_random_bytes(nonce);
    return target.parent_path() /
           (target.filename().string() + ".tmp-" + core::to_hex(nonce));
}

void sync_directory(const path& dir) {
    UniqueFd dfd(::open(dir.empty() ? "." : dir.c_str(),
                        O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (dfd) ::fsync(dfd.get());
}

} // anonymous namespace

path get_default_data_dir() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return path(home) / ".ctwallet";
    }
    return path("/tmp/.ctwallet");
}

bool ensure_directory(const path& dir) {
    if (dir.empty()) return true;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return std::filesystem::is_directory(dir, ec);
}

bool file_exists(const path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

bool rename_safe(const path& src, const path& dst) {
    return ::rename(src.c_str(), dst.c_str()) == 0;
}

std::optional<std::string> read_file(const path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return content;
}

bool write_file(const path& p, std::string_view content) {
    if (!ensure_directory(p.parent_path())) return false;

    path tmp = temp_sibling(p);
    UniqueFd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600));
    if (!fd) return false;

    bool ok = write_all(fd.get(), content) && ::fsync(fd.get()) == 0;
    ok = fd.close() && ok;
    if (!ok || !rename_safe(tmp, p)) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        return false;
    }
    sync_directory(p.parent_path());
    return true;
}

// ---------------------------------------------------------------------------
// FileLock
// ---------------------------------------------------------------------------

FileLock::~FileLock() {
    unlock();
}

bool FileLock::try_lock() {
    if (fd_ >= 0) return true;
    int fd = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) return false;
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        ::close(fd);
        return false;
    }
    fd_ = fd;
    return true;
}

void FileLock::unlock() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace core::fs
