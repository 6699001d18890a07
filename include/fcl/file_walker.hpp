#pragma once

#include <fcl/result.hpp>
#include <fcl/types.hpp>
#include <fcl/util/logger.hpp>

#include <functional>

namespace fcl {

/**
 * FileWalker - Produces the regular files under a directory.
 *
 * Each call to walk() restarts from the root, so the sequence can be
 * consumed any number of times. Directory order is whatever the
 * implementation yields; callers must not assume it is sorted.
 */
class FileWalker {
public:
    using Visitor = std::function<void(const FileRecord&)>;

    virtual ~FileWalker() = default;

    /**
     * Visit each regular file under root.
     *
     * @return NOT_FOUND if root is missing, INVALID_ARGUMENT if it is not a
     *         directory. Unreadable entries below the root are skipped.
     */
    virtual Result<void> walk(const fs::path& root, bool recursive, const Visitor& visit) const = 0;
};

/**
 * std::filesystem backed walker. Permission-denied subdirectories are
 * skipped and logged.
 */
class FilesystemWalker : public FileWalker {
public:
    explicit FilesystemWalker(Logger& logger) : logger_(logger) {}

    Result<void> walk(const fs::path& root, bool recursive, const Visitor& visit) const override;

    /**
     * Size and modification time of one file.
     */
    static Result<FileRecord> stat_file(const fs::path& path);

private:
    Logger& logger_;
};

}  // namespace fcl
