#pragma once

#include <fcl/result.hpp>
#include <fcl/types.hpp>
#include <fcl/util/logger.hpp>

namespace fcl {

/**
 * SafeMover - Relocates a single file without ever overwriting another.
 *
 * move() picks a free name when the destination is taken:
 *   report.pdf -> report_1.pdf -> report_2.pdf -> ...
 * The existence check and the rename are not atomic; the tree is assumed
 * to have a single writer for the duration of a batch.
 *
 * Renames that cross filesystems fall back to copy + remove.
 */
class SafeMover {
public:
    explicit SafeMover(Logger& logger) : logger_(logger) {}

    /**
     * Move source to destination, resolving name collisions.
     *
     * @return The path the file actually ended up at, or NOT_FOUND if the
     *         source vanished, PERMISSION_DENIED / IO_ERROR on failure
     */
    Result<fs::path> move(const fs::path& source, const fs::path& destination) const;

    /**
     * Move source to exactly destination. Fails with ALREADY_EXISTS instead
     * of picking another name.
     */
    Result<void> move_exact(const fs::path& source, const fs::path& destination) const;

    /**
     * First of destination, destination_1, destination_2, ... that does not exist.
     */
    static Result<fs::path> resolve_collision(const fs::path& destination);

private:
    Result<void> relocate(const fs::path& source, const fs::path& destination) const;

    Logger& logger_;
};

}  // namespace fcl
