#include <fcl/storage/record_log.hpp>
#include <fcl/util/crc32.hpp>

#include <cstring>
#include <iterator>

namespace fcl {

namespace {

constexpr char LOG_MAGIC[8] = {'F', 'C', 'L', 'L', 'O', 'G', '0', '1'};
constexpr size_t FRAME_HEADER_SIZE = 8;  // [len:4][crc:4]

void write_frame(std::ostream& out, const std::string& payload) {
    uint32_t len = static_cast<uint32_t>(payload.size());
    uint32_t crc = CRC32::compute(payload);
    out.write(reinterpret_cast<const char*>(&len), sizeof(len));
    out.write(reinterpret_cast<const char*>(&crc), sizeof(crc));
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
}

}  // namespace

Result<std::unique_ptr<RecordLog>> RecordLog::open(const fs::path& path) {
    auto log = std::unique_ptr<RecordLog>(new RecordLog(path));

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error(ErrorCode::STORAGE_ERROR,
                         "Failed to create directory for " + path.string() + ": " + ec.message());
        }
    }

    if (!fs::exists(path, ec) || fs::file_size(path, ec) == 0) {
        std::ofstream init(path, std::ios::binary | std::ios::trunc);
        init.write(LOG_MAGIC, sizeof(LOG_MAGIC));
        init.flush();
        if (!init.good()) {
            return Error(ErrorCode::STORAGE_ERROR, "Failed to create log " + path.string());
        }
    } else {
        std::ifstream in(path, std::ios::binary);
        char magic[sizeof(LOG_MAGIC)] = {};
        in.read(magic, sizeof(magic));
        if (!in.good() || std::memcmp(magic, LOG_MAGIC, sizeof(LOG_MAGIC)) != 0) {
            return Error(ErrorCode::CORRUPTION, path.string() + " is not an fcl record log");
        }
    }

    auto opened = log->open_for_append();
    if (!opened.ok()) {
        return opened.error();
    }
    return std::move(log);
}

RecordLog::~RecordLog() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

Result<void> RecordLog::open_for_append() {
    if (out_.is_open()) {
        out_.close();
    }
    out_.clear();
    out_.open(path_, std::ios::binary | std::ios::app);
    if (!out_.is_open()) {
        return Error(ErrorCode::STORAGE_ERROR, "Cannot open " + path_.string() + " for writing");
    }
    return Ok();
}

Result<ReplayStats> RecordLog::replay(const std::function<void(const std::string&)>& visit) {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return Error(ErrorCode::STORAGE_ERROR, "Cannot read " + path_.string());
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    ReplayStats stats;
    size_t offset = sizeof(LOG_MAGIC);
    while (offset + FRAME_HEADER_SIZE <= data.size()) {
        uint32_t len = 0;
        uint32_t crc = 0;
        std::memcpy(&len, data.data() + offset, sizeof(len));
        std::memcpy(&crc, data.data() + offset + sizeof(len), sizeof(crc));

        // Overflow-safe: len <= remaining
        if (len > data.size() - offset - FRAME_HEADER_SIZE) {
            break;
        }

        const char* payload = data.data() + offset + FRAME_HEADER_SIZE;
        if (CRC32::compute(payload, len) != crc) {
            break;
        }

        visit(std::string(payload, len));
        ++stats.records;
        offset += FRAME_HEADER_SIZE + len;
    }

    if (offset < data.size()) {
        stats.truncated_bytes = data.size() - offset;
        out_.close();

        std::error_code ec;
        fs::resize_file(path_, offset, ec);
        if (ec) {
            return Error(ErrorCode::STORAGE_ERROR,
                         "Failed to truncate damaged tail of " + path_.string() + ": " + ec.message());
        }

        auto reopened = open_for_append();
        if (!reopened.ok()) {
            return reopened.error();
        }
    }

    return stats;
}

Result<void> RecordLog::append(const std::string& payload) {
    if (!out_.is_open()) {
        return Error(ErrorCode::STORAGE_ERROR, "Log " + path_.string() + " is not open");
    }

    write_frame(out_, payload);
    out_.flush();

    if (!out_.good()) {
        out_.clear();
        return Error(ErrorCode::STORAGE_ERROR, "Failed to append to " + path_.string());
    }
    return Ok();
}

Result<void> RecordLog::rewrite(const std::vector<std::string>& payloads) {
    fs::path temp_path = path_;
    temp_path += ".tmp";

    {
        std::ofstream temp(temp_path, std::ios::binary | std::ios::trunc);
        if (!temp) {
            return Error(ErrorCode::STORAGE_ERROR, "Cannot create " + temp_path.string());
        }
        temp.write(LOG_MAGIC, sizeof(LOG_MAGIC));
        for (const auto& payload : payloads) {
            write_frame(temp, payload);
        }
        temp.flush();
        if (!temp.good()) {
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            return Error(ErrorCode::STORAGE_ERROR, "Failed to write " + temp_path.string());
        }
    }

    out_.close();

    std::error_code ec;
    fs::rename(temp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        auto reopened = open_for_append();
        if (!reopened.ok()) {
            return reopened.error();
        }
        return Error(ErrorCode::STORAGE_ERROR,
                     "Failed to replace " + path_.string() + ": " + ec.message());
    }

    return open_for_append();
}

}  // namespace fcl
