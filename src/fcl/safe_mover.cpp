#include <fcl/safe_mover.hpp>

#include <system_error>

namespace fcl {

namespace {

constexpr size_t MAX_COLLISION_ATTEMPTS = 10000;

Result<void> ensure_parent(const fs::path& destination) {
    if (!destination.has_parent_path()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
        return Err(ec, "Failed to create " + destination.parent_path().string());
    }
    return Ok();
}

Result<void> check_source(const fs::path& source) {
    std::error_code ec;
    auto status = fs::symlink_status(source, ec);
    if (ec || !fs::exists(status)) {
        return Error(ErrorCode::NOT_FOUND, "Source not found: " + source.string());
    }
    return Ok();
}

}  // namespace

Result<fs::path> SafeMover::resolve_collision(const fs::path& destination) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(destination, ec))) {
        return destination;
    }

    fs::path parent = destination.parent_path();
    std::string stem = destination.stem().string();
    std::string extension = destination.extension().string();

    for (size_t attempt = 1; attempt <= MAX_COLLISION_ATTEMPTS; ++attempt) {
        fs::path candidate = parent / (stem + "_" + std::to_string(attempt) + extension);
        if (!fs::exists(fs::symlink_status(candidate, ec))) {
            return candidate;
        }
    }

    return Error(ErrorCode::ALREADY_EXISTS,
                 "No free name for " + destination.string() + " after " +
                 std::to_string(MAX_COLLISION_ATTEMPTS) + " attempts");
}

Result<fs::path> SafeMover::move(const fs::path& source, const fs::path& destination) const {
    auto present = check_source(source);
    if (!present.ok()) {
        return present.error();
    }

    auto parent = ensure_parent(destination);
    if (!parent.ok()) {
        return parent.error();
    }

    auto target = resolve_collision(destination);
    if (!target.ok()) {
        return target.error();
    }
    if (target.value() != destination) {
        logger_.debug(destination.string() + " exists, using " + target.value().string());
    }

    auto moved = relocate(source, target.value());
    if (!moved.ok()) {
        return moved.error();
    }
    return target;
}

Result<void> SafeMover::move_exact(const fs::path& source, const fs::path& destination) const {
    auto present = check_source(source);
    if (!present.ok()) {
        return present;
    }

    std::error_code ec;
    if (fs::exists(fs::symlink_status(destination, ec))) {
        return Error(ErrorCode::ALREADY_EXISTS, "Destination occupied: " + destination.string());
    }

    auto parent = ensure_parent(destination);
    if (!parent.ok()) {
        return parent;
    }
    return relocate(source, destination);
}

Result<void> SafeMover::relocate(const fs::path& source, const fs::path& destination) const {
    std::error_code ec;
    fs::rename(source, destination, ec);
    if (!ec) {
        return Ok();
    }
    if (ec != std::errc::cross_device_link) {
        return Err(ec, "Failed to move " + source.string() + " to " + destination.string());
    }

    // Different filesystem: copy then remove the original
    std::error_code copy_ec;
    fs::copy_file(source, destination, fs::copy_options::none, copy_ec);
    if (copy_ec) {
        std::error_code ignored;
        fs::remove(destination, ignored);
        return Err(copy_ec, "Failed to copy " + source.string() + " to " + destination.string());
    }

    std::error_code remove_ec;
    fs::remove(source, remove_ec);
    if (remove_ec) {
        // Leave the source in place rather than end up with two copies
        std::error_code ignored;
        fs::remove(destination, ignored);
        return Err(remove_ec, "Failed to remove " + source.string() + " after copy");
    }

    logger_.debug("Copied across filesystems: " + source.string() + " -> " + destination.string());
    return Ok();
}

}  // namespace fcl
