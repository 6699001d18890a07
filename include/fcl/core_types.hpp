#pragma once

#include <fcl/result.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace fcl {

// Journal entry identifier - strictly increasing across restarts
using ActionId = uint64_t;
constexpr ActionId INVALID_ACTION_ID = 0;

// Block size used when streaming file content through the digest
constexpr size_t HASH_BLOCK_SIZE = 64 * 1024;

// Bytes inspected when sniffing file content
constexpr size_t SNIFF_BYTES = 512;

constexpr int64_t SECONDS_PER_DAY = 86400;

// Kind of a journaled filesystem mutation
enum class ActionKind : uint8_t {
    MOVE = 1,
    RENAME = 2,
    DELETE = 3
};

// Axis along which files are categorized
enum class Dimension {
    TYPE,
    SIZE,
    DATE
};

enum class ReportFormat {
    TEXT,
    JSON
};

inline const char* to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::MOVE:   return "move";
        case ActionKind::RENAME: return "rename";
        case ActionKind::DELETE: return "delete";
    }
    return "unknown";
}

inline const char* to_string(Dimension dimension) {
    switch (dimension) {
        case Dimension::TYPE: return "type";
        case Dimension::SIZE: return "size";
        case Dimension::DATE: return "date";
    }
    return "unknown";
}

inline Result<ActionKind> parse_action_kind(const std::string& s) {
    if (s == "move") return ActionKind::MOVE;
    if (s == "rename") return ActionKind::RENAME;
    if (s == "delete") return ActionKind::DELETE;
    return Error(ErrorCode::INVALID_ARGUMENT, "Unknown action kind: " + s);
}

inline Result<Dimension> parse_dimension(const std::string& s) {
    if (s == "type") return Dimension::TYPE;
    if (s == "size") return Dimension::SIZE;
    if (s == "date") return Dimension::DATE;
    return Error(ErrorCode::INVALID_ARGUMENT,
                 "Invalid sort criterion: " + s + " (expected type, size or date)");
}

inline Result<ReportFormat> parse_report_format(const std::string& s) {
    if (s == "text") return ReportFormat::TEXT;
    if (s == "json") return ReportFormat::JSON;
    return Error(ErrorCode::INVALID_ARGUMENT,
                 "Invalid report format: " + s + " (expected text or json)");
}

}  // namespace fcl
