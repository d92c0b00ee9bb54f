#include "verifier/work_area.hpp"

#include <cstdio>
#include <iostream>
#include <random>

#include <unistd.h>

namespace zk_insurance {

WorkArea::WorkArea(std::filesystem::path path, bool preserve)
    : path_(std::move(path)), preserve_(preserve) {}

WorkArea::WorkArea(WorkArea&& other) noexcept
    : path_(std::move(other.path_)), preserve_(other.preserve_), released_(other.released_) {
    other.released_ = true;
}

WorkArea::~WorkArea() {
    release();
}

void WorkArea::release() {
    if (released_) {
        return;
    }
    released_ = true;

    if (preserve_) {
        std::cerr << "[work_area] ZKI_PRESERVE_TMP set: preserving " << path_ << std::endl;
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[work_area] Failed to remove " << path_ << ": " << ec.message() << std::endl;
    }
}

namespace {

// Session ids restart at 1 and a container always runs as pid 1, so a
// random per-run token keeps a restarted server clear of stale directories
std::string make_run_token() {
    std::random_device rd;
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(rd()));
    return buf;
}

} // namespace

WorkAreaAllocator::WorkAreaAllocator(std::filesystem::path root, bool preserve)
    : root_(std::move(root)), preserve_(preserve), run_token_(make_run_token()) {}

std::filesystem::path WorkAreaAllocator::path_for(const std::string& session_id) const {
    return root_ / ("zki_" + std::to_string(::getpid()) + "_" + run_token_ + "_" + session_id);
}

std::optional<WorkArea> WorkAreaAllocator::acquire(const std::string& session_id,
                                                   std::error_code& ec) const {
    ec.clear();
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return std::nullopt;
    }

    auto path = path_for(session_id);
    bool created = std::filesystem::create_directory(path, ec);
    if (ec) {
        return std::nullopt;
    }
    if (!created) {
        ec = std::make_error_code(std::errc::file_exists);
        return std::nullopt;
    }
    return WorkArea(std::move(path), preserve_);
}

} // namespace zk_insurance
