#include <fcl/file_walker.hpp>

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace fcl {

namespace {

Result<void> check_root(const fs::path& root) {
    std::error_code ec;
    auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
        return Error(ErrorCode::NOT_FOUND, "Directory not found: " + root.string());
    }
    if (!fs::is_directory(status)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Not a directory: " + root.string());
    }
    return Ok();
}

template<typename Iterator>
void visit_entries(Iterator it, const FileWalker::Visitor& visit, Logger& logger) {
    std::error_code ec;
    for (auto end = Iterator(); it != end; it.increment(ec)) {
        if (ec) {
            logger.warning("Skipping unreadable entry: " + ec.message());
            ec.clear();
            continue;
        }

        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) {
            continue;
        }

        auto record = FilesystemWalker::stat_file(it->path());
        if (!record.ok()) {
            logger.warning(record.error().to_string());
            continue;
        }
        visit(record.value());
    }
}

}  // namespace

Result<FileRecord> FilesystemWalker::stat_file(const fs::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        int err = errno;
        return Err(std::error_code(err, std::generic_category()), "Cannot stat " + path.string());
    }

    FileRecord record;
    record.path = path;
    record.size = static_cast<uint64_t>(st.st_size);
    record.modified_at = Clock::from_time_t(st.st_mtim.tv_sec) +
        std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(st.st_mtim.tv_nsec));
    return record;
}

Result<void> FilesystemWalker::walk(const fs::path& root, bool recursive, const Visitor& visit) const {
    auto checked = check_root(root);
    if (!checked.ok()) {
        return checked;
    }

    std::error_code ec;
    const auto options = fs::directory_options::skip_permission_denied;
    if (recursive) {
        fs::recursive_directory_iterator it(root, options, ec);
        if (ec) {
            return Err(ec, "Cannot read " + root.string());
        }
        visit_entries(std::move(it), visit, logger_);
    } else {
        fs::directory_iterator it(root, options, ec);
        if (ec) {
            return Err(ec, "Cannot read " + root.string());
        }
        visit_entries(std::move(it), visit, logger_);
    }
    return Ok();
}

}  // namespace fcl
