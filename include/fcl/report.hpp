#pragma once

#include <fcl/types.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fcl {

struct CategoryStats {
    uint64_t count = 0;
    uint64_t size = 0;
};

/**
 * Aggregate file statistics for one directory.
 */
struct ReportStats {
    fs::path directory;
    uint64_t total_files = 0;
    uint64_t total_size = 0;
    std::map<std::string, CategoryStats> by_type;
    std::map<std::string, CategoryStats> by_size;
    std::map<std::string, CategoryStats> by_date;

    void add(const std::string& type,
             const std::string& size_category,
             const std::string& date_category,
             uint64_t size);
};

/**
 * Render sizes as "0 B", "512.00 B", "1.50 KB", ... up to YB.
 */
std::string human_readable_size(uint64_t size_bytes);

/**
 * ReportRenderer - Formats ReportStats as text or JSON.
 *
 * Empty categories never appear. Type categories are listed by descending
 * file count (ties by name); size and date categories follow the order of
 * the label lists given at construction. Both formats carry the same totals.
 */
class ReportRenderer {
public:
    ReportRenderer(std::vector<std::string> size_order, std::vector<std::string> date_order)
        : size_order_(std::move(size_order)), date_order_(std::move(date_order)) {}

    std::string render_text(const ReportStats& stats, bool human_readable) const;
    std::string render_json(const ReportStats& stats, bool human_readable) const;

    using Row = std::pair<std::string, CategoryStats>;

    static std::vector<Row> by_count(const std::map<std::string, CategoryStats>& categories);
    static std::vector<Row> in_order(const std::map<std::string, CategoryStats>& categories,
                                     const std::vector<std::string>& order);

private:
    std::vector<std::string> size_order_;
    std::vector<std::string> date_order_;
};

}  // namespace fcl
