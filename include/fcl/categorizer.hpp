#pragma once

#include <fcl/types.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace fcl {

/**
 * Categorizer - Maps a file to a semantic bucket along one dimension.
 *
 * classify() is total: it always returns a label and never fails. Sniffing
 * errors for unknown extensions degrade to "other".
 *
 * - type: configured extension table, with the plain-text subset of
 *   "documents" (.txt .md .csv .log) reported as "text"; unknown
 *   extensions fall back to content sniffing.
 * - size: first bucket whose exclusive upper bound exceeds the size,
 *   buckets tried in ascending order; otherwise the open-ended bucket.
 * - date: today, this_week, this_month, this_year, older, evaluated in
 *   that order against local calendar dates.
 */
class Categorizer {
public:
    explicit Categorizer(const Config& config);

    std::string classify(const FileRecord& file, Dimension dimension) const;
    std::string classify(const FileRecord& file, Dimension dimension, TimePoint now) const;

    std::string type_of(const fs::path& path) const;
    std::string size_category(uint64_t size) const;
    static std::string date_category(TimePoint modified, TimePoint now);

    /**
     * Type category for a sniffed MIME type.
     */
    static std::string type_from_mime(const std::string& mime);

    /**
     * Size labels in ascending bucket order.
     */
    const std::vector<std::string>& size_labels() const { return size_labels_; }

    /**
     * Date labels from newest to oldest.
     */
    static const std::vector<std::string>& date_labels();

private:
    std::unordered_map<std::string, std::string> extension_to_type_;
    std::vector<SizeBucket> buckets_;      // bounded buckets, ascending
    std::string open_label_;               // catches everything above the last bound
    std::vector<std::string> size_labels_;
};

}  // namespace fcl
