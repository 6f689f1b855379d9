#include "hearthfs/sandbox/platform_backend.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <sys/stat.h>

#include "hearthfs/core/logger.hpp"
#include "hearthfs/infra/paths.hpp"

namespace hearthfs::sandbox {

namespace fs = std::filesystem;

auto errno_to_error(int err, std::string_view operation, const std::string& path) -> Error {
    auto detail = path + ": " + std::strerror(err);
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return make_error(ErrorCode::NotFound,
                std::string(operation) + " failed: no such file or directory", detail);
        case EEXIST:
            return make_error(ErrorCode::AlreadyExists,
                std::string(operation) + " failed: entry already exists", detail);
        case EACCES:
        case EPERM:
            return make_error(ErrorCode::Forbidden,
                std::string(operation) + " failed: permission denied", detail);
        default:
            return make_error(ErrorCode::IoError,
                std::string(operation) + " failed", detail);
    }
}

namespace {

auto from_error_code(const std::error_code& ec, std::string_view operation,
                     const std::string& path) -> Error {
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return errno_to_error(ec.value(), operation, path);
    }
    return make_error(ErrorCode::IoError, std::string(operation) + " failed",
        path + ": " + ec.message());
}

auto to_link_metadata(const struct stat& st) -> LinkMetadata {
    return LinkMetadata{
        .is_symlink = S_ISLNK(st.st_mode),
        .is_directory = S_ISDIR(st.st_mode),
        .is_regular_file = S_ISREG(st.st_mode),
    };
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// PlatformPathProvider
// ---------------------------------------------------------------------------

PlatformPathProvider::PlatformPathProvider(SandboxConfig config)
    : config_(std::move(config)) {}

auto PlatformPathProvider::special_dir(SpecialDir dir) -> Result<std::string> {
    switch (dir) {
        case SpecialDir::AppData:
            if (config_.data_dir && !config_.data_dir->empty()) {
                return *config_.data_dir;
            }
            return infra::data_dir(config_.app_name).generic_string();
        case SpecialDir::AppConfig:
            return infra::config_dir(config_.app_name).generic_string();
        case SpecialDir::AppCache:
            return infra::cache_dir(config_.app_name).generic_string();
        case SpecialDir::AppLogs:
            return infra::logs_dir(config_.app_name).generic_string();
    }
    return std::unexpected(make_error(ErrorCode::InvalidArgument,
        "Unknown special directory"));
}

// ---------------------------------------------------------------------------
// LocalFileSystem
// ---------------------------------------------------------------------------

auto LocalFileSystem::symlink_metadata(const std::string& path) -> Result<LinkMetadata> {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        return std::unexpected(errno_to_error(errno, "lstat", path));
    }
    return to_link_metadata(st);
}

auto LocalFileSystem::lstat(const std::string& path) -> awaitable<Result<LinkMetadata>> {
    co_return symlink_metadata(path);
}

auto LocalFileSystem::read_text_file(const std::string& path)
    -> awaitable<Result<std::string>> {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        co_return make_fail(errno_to_error(errno, "read", path));
    }
    if (S_ISDIR(st.st_mode)) {
        co_return make_fail(make_error(ErrorCode::IoError,
            "read failed: is a directory", path));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        co_return make_fail(errno_to_error(errno, "read", path));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        co_return make_fail(make_error(ErrorCode::IoError, "read failed", path));
    }
    LOG_DEBUG("Read {} bytes from {}", content.size(), path);
    co_return Result<std::string>{std::move(content)};
}

auto LocalFileSystem::write_text_file(const std::string& path, const std::string& data)
    -> awaitable<Result<void>> {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        co_return make_fail(errno_to_error(errno != 0 ? errno : EIO, "write", path));
    }

    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        co_return make_fail(make_error(ErrorCode::IoError, "write failed", path));
    }
    LOG_DEBUG("Wrote {} bytes to {}", data.size(), path);
    co_return ok_result();
}

auto LocalFileSystem::list_directory(const std::string& path)
    -> awaitable<Result<std::vector<DirEntry>>> {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        co_return make_fail(from_error_code(ec, "list", path));
    }

    // Advance with increment(ec); operator++ throws on a failed readdir.
    // A failed increment leaves `it` at end with `ec` set.
    std::vector<DirEntry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        auto status = entry.symlink_status(ec);
        if (ec) {
            co_return make_fail(from_error_code(ec, "list", entry.path().string()));
        }
        entries.push_back(DirEntry{
            .name = entry.path().filename().string(),
            .is_directory = fs::is_directory(status),
            .is_file = fs::is_regular_file(status),
            .is_symlink = fs::is_symlink(status),
        });
    }
    if (ec) {
        co_return make_fail(from_error_code(ec, "list", path));
    }

    std::ranges::sort(entries, {}, &DirEntry::name);
    co_return Result<std::vector<DirEntry>>{std::move(entries)};
}

auto LocalFileSystem::create_directory(const std::string& path, bool recursive)
    -> awaitable<Result<void>> {
    std::error_code ec;
    if (recursive) {
        fs::create_directories(path, ec);
        if (ec) {
            co_return make_fail(from_error_code(ec, "mkdir", path));
        }
        co_return ok_result();
    }

    bool created = fs::create_directory(path, ec);
    if (ec) {
        co_return make_fail(from_error_code(ec, "mkdir", path));
    }
    if (!created) {
        co_return make_fail(errno_to_error(EEXIST, "mkdir", path));
    }
    co_return ok_result();
}

auto LocalFileSystem::remove(const std::string& path, bool recursive)
    -> awaitable<Result<void>> {
    // Existence is checked without following a final link so that
    // removing a dangling link works and removes the link itself.
    auto meta = symlink_metadata(path);
    if (!meta) {
        co_return make_fail(meta.error());
    }

    std::error_code ec;
    if (recursive) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    if (ec) {
        co_return make_fail(from_error_code(ec, "remove", path));
    }
    LOG_DEBUG("Removed {}{}", path, recursive ? " (recursive)" : "");
    co_return ok_result();
}

// ---------------------------------------------------------------------------
// Wiring
// ---------------------------------------------------------------------------

auto make_platform_file_ops(const SandboxConfig& config) -> std::shared_ptr<SafeFileOps> {
    auto local = std::make_shared<LocalFileSystem>();
    auto ctx = std::make_shared<SandboxContext>(
        std::make_shared<PlatformPathProvider>(config), local, config.attachments_dir);
    return std::make_shared<SafeFileOps>(
        std::make_shared<SandboxPathPolicy>(std::move(ctx)), local);
}

} // namespace hearthfs::sandbox
