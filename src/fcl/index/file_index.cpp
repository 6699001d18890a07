#include <fcl/index/file_index.hpp>
#include <fcl/util/serializer.hpp>

namespace fcl {

namespace {

constexpr size_t COMPACT_MIN_STALE = 256;

int64_t to_micros(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint from_micros(int64_t us) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(us)));
}

}  // namespace

// Entry format:
// [path:str][fingerprint:str][size:8][modified_us:8][type:str][indexed_us:8]
std::string FileIndex::serialize(const IndexEntry& entry) {
    BinaryWriter writer;
    writer.write_string(entry.path.string());
    writer.write_string(entry.fingerprint);
    writer.write_uint64(entry.size);
    writer.write_int64(to_micros(entry.modified_at));
    writer.write_string(entry.type);
    writer.write_int64(to_micros(entry.indexed_at));
    return writer.release();
}

std::optional<IndexEntry> FileIndex::deserialize(const std::string& data) {
    BinaryReader reader(data);
    IndexEntry entry;
    std::string path;
    int64_t modified_us = 0;
    int64_t indexed_us = 0;

    if (!reader.read_string(&path) ||
        !reader.read_string(&entry.fingerprint) ||
        !reader.read_uint64(&entry.size) ||
        !reader.read_int64(&modified_us) ||
        !reader.read_string(&entry.type) ||
        !reader.read_int64(&indexed_us)) {
        return std::nullopt;
    }

    if (path.empty()) {
        return std::nullopt;
    }

    entry.path = path;
    entry.modified_at = from_micros(modified_us);
    entry.indexed_at = from_micros(indexed_us);
    return entry;
}

Result<std::unique_ptr<FileIndex>> FileIndex::open(const fs::path& path, Logger& logger) {
    auto log = RecordLog::open(path);
    if (!log.ok()) {
        return log.error();
    }

    auto index = std::unique_ptr<FileIndex>(new FileIndex(std::move(log.value()), logger));

    size_t skipped = 0;
    auto stats = index->log_->replay([&index, &skipped](const std::string& payload) {
        auto entry = deserialize(payload);
        if (!entry.has_value()) {
            ++skipped;
            return;
        }
        std::string key = entry->path.string();
        index->entries_[key] = std::move(*entry);
    });
    if (!stats.ok()) {
        return stats.error();
    }

    index->record_count_ = stats.value().records;
    if (skipped > 0) {
        logger.warning("File index: skipped " + std::to_string(skipped) + " undecodable records");
    }
    if (stats.value().truncated_bytes > 0) {
        logger.warning("File index " + path.string() + ": discarded " +
                       std::to_string(stats.value().truncated_bytes) + " bytes of damaged tail");
    }

    size_t stale = index->record_count_ - index->entries_.size();
    if (stale >= COMPACT_MIN_STALE && stale > index->entries_.size()) {
        auto compacted = index->compact();
        if (!compacted.ok()) {
            logger.warning("File index compaction failed: " + compacted.error().to_string());
        }
    }

    return std::move(index);
}

Result<void> FileIndex::upsert(const IndexEntry& entry) {
    auto written = log_->append(serialize(entry));
    if (!written.ok()) {
        return written.error();
    }
    ++record_count_;
    entries_[entry.path.string()] = entry;
    return Ok();
}

std::optional<IndexEntry> FileIndex::get(const fs::path& path) const {
    auto it = entries_.find(path.string());
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<IndexEntry> FileIndex::entries() const {
    std::vector<IndexEntry> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

Result<void> FileIndex::compact() {
    std::vector<std::string> payloads;
    payloads.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        payloads.push_back(serialize(entry));
    }

    auto rewritten = log_->rewrite(payloads);
    if (!rewritten.ok()) {
        return rewritten.error();
    }
    logger_.debug("File index compacted to " + std::to_string(payloads.size()) + " records");
    record_count_ = payloads.size();
    return Ok();
}

}  // namespace fcl
