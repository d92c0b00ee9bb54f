#pragma once

/**
 * Per-session scratch directories.
 *
 * Each proof runs in <root>/zki_<pid>_<run token>_<session id> so concurrent
 * sessions never share circuit inputs or toolchain outputs, and directories
 * left by an earlier run of the server never collide with this one. A WorkArea removes its
 * directory when it goes out of scope.
 */

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace zk_insurance {

class WorkArea {
public:
    WorkArea(std::filesystem::path path, bool preserve);
    ~WorkArea();

    WorkArea(const WorkArea&) = delete;
    WorkArea& operator=(const WorkArea&) = delete;
    WorkArea(WorkArea&& other) noexcept;
    WorkArea& operator=(WorkArea&& other) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Remove the directory now instead of at destruction
    void release();

private:
    std::filesystem::path path_;
    bool preserve_;
    bool released_ = false;
};

class WorkAreaAllocator {
public:
    WorkAreaAllocator(std::filesystem::path root, bool preserve);

    /**
     * Create the directory for a session.
     *
     * Fails (nullopt, with `ec` set) if the directory cannot be created or
     * already exists, which would mean two sessions share an identifier.
     */
    std::optional<WorkArea> acquire(const std::string& session_id, std::error_code& ec) const;

    std::filesystem::path path_for(const std::string& session_id) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    bool preserve_;
    std::string run_token_;  // random, fixed for the allocator's lifetime
};

} // namespace zk_insurance
