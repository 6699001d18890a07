#include <fcl/categorizer.hpp>
#include <fcl/content_sniffer.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <set>

namespace fcl {

namespace {

const std::set<std::string> TEXT_EXTENSIONS = {".txt", ".md", ".csv", ".log"};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalize_extension(std::string extension) {
    extension = to_lower(std::move(extension));
    if (!extension.empty() && extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }
    return extension;
}

struct CivilDate {
    int year;
    int month;  // 1-12
    int day;
};

CivilDate local_date(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    return {local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

// Days since 1970-01-01 in the proleptic Gregorian calendar
int64_t days_from_civil(const CivilDate& date) {
    int64_t y = date.year - (date.month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (date.month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + date.day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

}  // namespace

Categorizer::Categorizer(const Config& config) {
    for (const auto& rule : config.type_rules) {
        for (const auto& ext : rule.extensions) {
            std::string normalized = normalize_extension(ext);
            if (normalized.empty()) {
                continue;
            }
            // First rule listing an extension wins
            extension_to_type_.emplace(std::move(normalized), rule.type);
        }
    }

    for (const auto& bucket : config.size_buckets) {
        if (bucket.upper_bound.has_value()) {
            buckets_.push_back(bucket);
        } else if (open_label_.empty()) {
            open_label_ = bucket.label;
        }
    }
    std::stable_sort(buckets_.begin(), buckets_.end(),
        [](const SizeBucket& a, const SizeBucket& b) {
            return *a.upper_bound < *b.upper_bound;
        });

    if (open_label_.empty()) {
        open_label_ = "huge";
    }

    for (const auto& bucket : buckets_) {
        size_labels_.push_back(bucket.label);
    }
    if (std::find(size_labels_.begin(), size_labels_.end(), open_label_) == size_labels_.end()) {
        size_labels_.push_back(open_label_);
    }
}

std::string Categorizer::classify(const FileRecord& file, Dimension dimension) const {
    return classify(file, dimension, Clock::now());
}

std::string Categorizer::classify(const FileRecord& file, Dimension dimension, TimePoint now) const {
    switch (dimension) {
        case Dimension::TYPE: return type_of(file.path);
        case Dimension::SIZE: return size_category(file.size);
        case Dimension::DATE: return date_category(file.modified_at, now);
    }
    return "other";
}

std::string Categorizer::type_of(const fs::path& path) const {
    std::string extension = to_lower(path.extension().string());

    if (!extension.empty()) {
        auto it = extension_to_type_.find(extension);
        if (it != extension_to_type_.end()) {
            if (it->second == "documents" && TEXT_EXTENSIONS.count(extension) > 0) {
                return "text";
            }
            return it->second;
        }
    }

    auto mime = ContentSniffer::sniff(path);
    if (!mime.ok()) {
        return "other";
    }
    return type_from_mime(mime.value());
}

std::string Categorizer::type_from_mime(const std::string& mime) {
    auto starts_with = [&mime](const char* prefix) {
        return mime.rfind(prefix, 0) == 0;
    };

    if (starts_with("image/")) return "images";
    if (starts_with("video/")) return "videos";
    if (starts_with("audio/")) return "audio";
    if (starts_with("text/")) return "text";

    if (mime == "application/pdf" ||
        mime == "application/msword" ||
        mime == "application/vnd.openxmlformats-officedocument.wordprocessingml.document") {
        return "documents";
    }
    if (mime == "application/zip" ||
        mime == "application/x-rar-compressed" ||
        mime == "application/x-tar" ||
        mime == "application/gzip") {
        return "archives";
    }
    return "other";
}

std::string Categorizer::size_category(uint64_t size) const {
    for (const auto& bucket : buckets_) {
        if (size < *bucket.upper_bound) {
            return bucket.label;
        }
    }
    return open_label_;
}

std::string Categorizer::date_category(TimePoint modified, TimePoint now) {
    CivilDate file_date = local_date(modified);
    CivilDate today = local_date(now);

    int64_t age_days = days_from_civil(today) - days_from_civil(file_date);

    if (age_days == 0) {
        return "today";
    }
    if (age_days <= 7) {
        return "this_week";
    }
    if (file_date.year == today.year && file_date.month == today.month) {
        return "this_month";
    }
    if (file_date.year == today.year) {
        return "this_year";
    }
    return "older";
}

const std::vector<std::string>& Categorizer::date_labels() {
    static const std::vector<std::string> labels = {
        "today", "this_week", "this_month", "this_year", "older"
    };
    return labels;
}

}  // namespace fcl
