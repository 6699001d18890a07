#include <fcl/journal/action_journal.hpp>
#include <fcl/util/serializer.hpp>

#include <algorithm>

namespace fcl {

namespace {

// Record payload formats:
// ACTION: [type:1][id:8][kind:1][created_us:8][source:str][destination:opt str][metadata:str]
// REMOVE: [type:1][count:4][id:8]*
// WATERMARK: [type:1][next_id:8][last_us:8]  (first record after compaction)
enum class RecordType : uint8_t {
    ACTION = 1,
    REMOVE = 2,
    WATERMARK = 3
};

// Compaction kicks in once this many dead records sit in the file and they
// outnumber the live entries.
constexpr size_t COMPACT_MIN_STALE = 64;

int64_t to_micros(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint from_micros(int64_t us) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(us)));
}

std::string encode_action(const ActionEntry& entry) {
    BinaryWriter writer;
    writer.write_uint8(static_cast<uint8_t>(RecordType::ACTION));
    writer.write_uint64(entry.id);
    writer.write_uint8(static_cast<uint8_t>(entry.kind));
    writer.write_int64(to_micros(entry.created_at));
    writer.write_string(entry.source.string());
    std::optional<std::string> destination;
    if (entry.destination.has_value()) {
        destination = entry.destination->string();
    }
    writer.write_optional_string(destination);
    writer.write_string(entry.metadata);
    return writer.release();
}

std::string encode_remove(const std::vector<ActionId>& ids) {
    BinaryWriter writer;
    writer.write_uint8(static_cast<uint8_t>(RecordType::REMOVE));
    writer.write_uint32(static_cast<uint32_t>(ids.size()));
    for (ActionId id : ids) {
        writer.write_uint64(id);
    }
    return writer.release();
}

std::string encode_watermark(ActionId next_id, TimePoint last_timestamp) {
    BinaryWriter writer;
    writer.write_uint8(static_cast<uint8_t>(RecordType::WATERMARK));
    writer.write_uint64(next_id);
    writer.write_int64(to_micros(last_timestamp));
    return writer.release();
}

std::optional<ActionEntry> decode_action(BinaryReader& reader) {
    ActionEntry entry;
    uint8_t kind = 0;
    int64_t created_us = 0;
    std::string source;
    std::optional<std::string> destination;

    if (!reader.read_uint64(&entry.id) ||
        !reader.read_uint8(&kind) ||
        !reader.read_int64(&created_us) ||
        !reader.read_string(&source) ||
        !reader.read_optional_string(&destination) ||
        !reader.read_string(&entry.metadata)) {
        return std::nullopt;
    }

    switch (static_cast<ActionKind>(kind)) {
        case ActionKind::MOVE:
        case ActionKind::RENAME:
        case ActionKind::DELETE:
            entry.kind = static_cast<ActionKind>(kind);
            break;
        default:
            return std::nullopt;
    }

    if (entry.id == INVALID_ACTION_ID) {
        return std::nullopt;
    }

    entry.created_at = from_micros(created_us);
    entry.source = source;
    if (destination.has_value()) {
        entry.destination = fs::path(*destination);
    }
    return entry;
}

}  // namespace

Result<std::unique_ptr<ActionJournal>> ActionJournal::open(const fs::path& path,
                                                           Logger& logger,
                                                           size_t max_entries) {
    auto log = RecordLog::open(path);
    if (!log.ok()) {
        return log.error();
    }

    auto journal = std::unique_ptr<ActionJournal>(
        new ActionJournal(std::move(log.value()), logger, max_entries));

    auto stats = journal->log_->replay([&journal](const std::string& payload) {
        journal->apply(payload);
    });
    if (!stats.ok()) {
        return stats.error();
    }

    journal->record_count_ = stats.value().records;
    if (stats.value().truncated_bytes > 0) {
        logger.warning("Journal " + path.string() + ": discarded " +
                       std::to_string(stats.value().truncated_bytes) +
                       " bytes of incomplete trailing record");
    }
    logger.debug("Journal " + path.string() + " opened with " +
                 std::to_string(journal->entries_.size()) + " entries");

    auto compacted = journal->compact_if_needed();
    if (!compacted.ok()) {
        logger.warning("Journal compaction failed: " + compacted.error().to_string());
    }

    return std::move(journal);
}

void ActionJournal::apply(const std::string& payload) {
    BinaryReader reader(payload);
    uint8_t type = 0;
    if (!reader.read_uint8(&type)) {
        logger_.warning("Journal: skipping empty record");
        return;
    }

    if (type == static_cast<uint8_t>(RecordType::ACTION)) {
        auto entry = decode_action(reader);
        if (!entry.has_value()) {
            logger_.warning("Journal: skipping undecodable action record");
            return;
        }
        next_id_ = std::max(next_id_, entry->id + 1);
        last_timestamp_ = std::max(last_timestamp_, entry->created_at);
        entries_[entry->id] = std::move(*entry);
    } else if (type == static_cast<uint8_t>(RecordType::REMOVE)) {
        uint32_t count = 0;
        if (!reader.read_uint32(&count)) {
            logger_.warning("Journal: skipping undecodable remove record");
            return;
        }
        for (uint32_t i = 0; i < count; ++i) {
            ActionId id = INVALID_ACTION_ID;
            if (!reader.read_uint64(&id)) {
                logger_.warning("Journal: remove record cut short");
                return;
            }
            entries_.erase(id);
        }
    } else if (type == static_cast<uint8_t>(RecordType::WATERMARK)) {
        ActionId next_id = INVALID_ACTION_ID;
        int64_t last_us = 0;
        if (!reader.read_uint64(&next_id) || !reader.read_int64(&last_us)) {
            logger_.warning("Journal: skipping undecodable watermark record");
            return;
        }
        next_id_ = std::max(next_id_, next_id);
        last_timestamp_ = std::max(last_timestamp_, from_micros(last_us));
        stale_base_ = 1;
    } else {
        logger_.warning("Journal: skipping record of unknown type " + std::to_string(type));
    }
}

Result<ActionId> ActionJournal::append(ActionKind kind,
                                       const fs::path& source,
                                       const std::optional<fs::path>& destination,
                                       const std::string& metadata) {
    ActionEntry entry;
    entry.id = next_id_;
    entry.kind = kind;
    entry.source = source;
    entry.destination = destination;
    entry.metadata = metadata;
    entry.created_at = std::max(Clock::now(), last_timestamp_);

    auto written = log_->append(encode_action(entry));
    if (!written.ok()) {
        return written.error();
    }

    ++next_id_;
    ++record_count_;
    last_timestamp_ = entry.created_at;
    ActionId id = entry.id;
    entries_[id] = std::move(entry);

    auto capped = enforce_cap();
    if (!capped.ok()) {
        logger_.error("Journal: failed to drop entries beyond history limit: " +
                      capped.error().to_string());
    }

    return id;
}

std::vector<ActionEntry> ActionJournal::most_recent(std::optional<size_t> n) const {
    std::vector<ActionEntry> result;
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back(entry);
    }

    std::sort(result.begin(), result.end(), [](const ActionEntry& a, const ActionEntry& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        return a.id > b.id;
    });

    if (n.has_value() && result.size() > *n) {
        result.resize(*n);
    }
    return result;
}

Result<void> ActionJournal::remove(const std::vector<ActionId>& ids) {
    std::vector<ActionId> live;
    for (ActionId id : ids) {
        if (entries_.count(id) > 0 &&
            std::find(live.begin(), live.end(), id) == live.end()) {
            live.push_back(id);
        }
    }
    if (live.empty()) {
        return Ok();
    }

    auto written = log_->append(encode_remove(live));
    if (!written.ok()) {
        return written.error();
    }

    ++record_count_;
    for (ActionId id : live) {
        entries_.erase(id);
    }

    auto compacted = compact_if_needed();
    if (!compacted.ok()) {
        logger_.warning("Journal compaction failed: " + compacted.error().to_string());
    }
    return Ok();
}

Result<void> ActionJournal::enforce_cap() {
    if (max_entries_ == 0 || entries_.size() <= max_entries_) {
        return Ok();
    }

    // Ids grow with timestamps, so the smallest ids are the oldest entries
    std::vector<ActionId> oldest;
    size_t excess = entries_.size() - max_entries_;
    for (auto it = entries_.begin(); it != entries_.end() && oldest.size() < excess; ++it) {
        oldest.push_back(it->first);
    }

    logger_.info("Journal: dropping " + std::to_string(oldest.size()) +
                 " oldest entr" + (oldest.size() == 1 ? "y" : "ies") +
                 " beyond the history limit of " + std::to_string(max_entries_));
    return remove(oldest);
}

Result<void> ActionJournal::compact_if_needed() {
    size_t overhead = entries_.size() + stale_base_;
    size_t stale = record_count_ - std::min(record_count_, overhead);
    if (stale < COMPACT_MIN_STALE || stale <= entries_.size()) {
        return Ok();
    }
    return compact();
}

Result<void> ActionJournal::compact() {
    std::vector<std::string> payloads;
    payloads.reserve(entries_.size() + 1);
    payloads.push_back(encode_watermark(next_id_, last_timestamp_));
    for (const auto& [id, entry] : entries_) {
        payloads.push_back(encode_action(entry));
    }

    auto rewritten = log_->rewrite(payloads);
    if (!rewritten.ok()) {
        return rewritten.error();
    }

    logger_.debug("Journal compacted from " + std::to_string(record_count_) +
                  " to " + std::to_string(payloads.size()) + " records");
    record_count_ = payloads.size();
    stale_base_ = 1;
    return Ok();
}

}  // namespace fcl
