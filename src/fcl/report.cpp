#include <fcl/report.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace fcl {

using json = nlohmann::ordered_json;

namespace {

std::string format_size(uint64_t size, bool human_readable) {
    if (human_readable) {
        return human_readable_size(size);
    }
    return std::to_string(size) + " bytes";
}

void write_section(std::ostringstream& out,
                   const char* title,
                   const std::vector<ReportRenderer::Row>& rows,
                   bool human_readable) {
    out << "\n" << title << ":\n";
    for (const auto& [label, category] : rows) {
        out << "  " << label << ": " << category.count
            << (category.count == 1 ? " file, " : " files, ")
            << format_size(category.size, human_readable) << "\n";
    }
}

json section_json(const std::vector<ReportRenderer::Row>& rows, bool human_readable) {
    json section = json::object();
    for (const auto& [label, category] : rows) {
        json entry;
        entry["count"] = category.count;
        entry["size"] = category.size;
        if (human_readable) {
            entry["size_human"] = human_readable_size(category.size);
        }
        section[label] = std::move(entry);
    }
    return section;
}

}  // namespace

void ReportStats::add(const std::string& type,
                      const std::string& size_category,
                      const std::string& date_category,
                      uint64_t size) {
    ++total_files;
    total_size += size;

    for (auto* bucket : {&by_type[type], &by_size[size_category], &by_date[date_category]}) {
        ++bucket->count;
        bucket->size += size;
    }
}

std::string human_readable_size(uint64_t size_bytes) {
    if (size_bytes == 0) {
        return "0 B";
    }

    static const char* UNITS[] = {"B", "KB", "MB", "GB", "TB", "PB", "EB", "ZB", "YB"};
    constexpr size_t UNIT_COUNT = sizeof(UNITS) / sizeof(UNITS[0]);

    double value = static_cast<double>(size_bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < UNIT_COUNT - 1) {
        value /= 1024.0;
        ++unit;
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f %s", value, UNITS[unit]);
    return buffer;
}

std::vector<ReportRenderer::Row> ReportRenderer::by_count(
    const std::map<std::string, CategoryStats>& categories) {
    std::vector<Row> rows;
    for (const auto& [label, category] : categories) {
        if (category.count > 0) {
            rows.emplace_back(label, category);
        }
    }
    // Map order already sorts by name, so a stable sort breaks count ties by name
    std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
        return a.second.count > b.second.count;
    });
    return rows;
}

std::vector<ReportRenderer::Row> ReportRenderer::in_order(
    const std::map<std::string, CategoryStats>& categories,
    const std::vector<std::string>& order) {
    std::vector<Row> rows;
    for (const auto& label : order) {
        auto it = categories.find(label);
        if (it != categories.end() && it->second.count > 0) {
            rows.emplace_back(label, it->second);
        }
    }
    // Labels outside the canonical order go last, by name
    for (const auto& [label, category] : categories) {
        if (category.count > 0 && std::find(order.begin(), order.end(), label) == order.end()) {
            rows.emplace_back(label, category);
        }
    }
    return rows;
}

std::string ReportRenderer::render_text(const ReportStats& stats, bool human_readable) const {
    std::ostringstream out;
    out << "Report for " << stats.directory.string() << "\n";
    out << "Total files: " << stats.total_files << "\n";
    out << "Total size: " << format_size(stats.total_size, human_readable) << "\n";

    write_section(out, "By type", by_count(stats.by_type), human_readable);
    write_section(out, "By size", in_order(stats.by_size, size_order_), human_readable);
    write_section(out, "By date", in_order(stats.by_date, date_order_), human_readable);
    return out.str();
}

std::string ReportRenderer::render_json(const ReportStats& stats, bool human_readable) const {
    json report;
    report["directory"] = stats.directory.string();
    report["total_files"] = stats.total_files;
    report["total_size"] = stats.total_size;
    if (human_readable) {
        report["total_size_human"] = human_readable_size(stats.total_size);
    }
    report["by_type"] = section_json(by_count(stats.by_type), human_readable);
    report["by_size"] = section_json(in_order(stats.by_size, size_order_), human_readable);
    report["by_date"] = section_json(in_order(stats.by_date, date_order_), human_readable);
    return report.dump(4);
}

}  // namespace fcl
