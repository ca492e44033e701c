#include "report.hpp"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace quarry {

std::string format_timestamp(double seconds) {
    long total = seconds > 0 ? static_cast<long>(std::floor(seconds)) : 0;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << total / 60 << ':'
        << std::setw(2) << total % 60;
    return oss.str();
}

std::string format_utc(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm_utc;
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S") << " UTC";
    return oss.str();
}

std::string render_markdown_report(const std::string& subject,
                                   const std::vector<QuestionRecord>& records,
                                   int64_t generated_at) {
    // Group by primary source URL, keeping first-seen order
    std::vector<std::string> order;
    std::vector<std::vector<const QuestionRecord*>> groups;
    for (const auto& record : records) {
        const std::string& url = record.primary_source().url;
        size_t slot = 0;
        while (slot < order.size() && order[slot] != url) {
            ++slot;
        }
        if (slot == order.size()) {
            order.push_back(url);
            groups.emplace_back();
        }
        groups[slot].push_back(&record);
    }

    std::ostringstream md;
    md << "# Questions Asked to " << subject << "\n\n";
    md << "**Generated:** " << format_utc(generated_at) << "\n\n";
    md << "**Total Questions:** " << records.size() << "\n\n";
    md << "---\n\n";

    for (const auto& group : groups) {
        const SourceRef& source = group.front()->primary_source();
        md << "## " << (source.title.empty() ? source.url : source.title) << "\n\n";
        md << "**Type:** " << to_string(source.type);
        if (!source.published.empty()) {
            md << " | **Published:** " << source.published;
        }
        md << "\n\n";
        md << "**Questions in this source:** " << group.size() << "\n\n";

        int idx = 1;
        for (const QuestionRecord* record : group) {
            const SourceRef& primary = record->primary_source();
            md << "### " << idx++ << ". " << record->text << "\n\n";
            if (primary.media_timestamp) {
                std::string ts = format_timestamp(*primary.media_timestamp);
                md << "- **Timestamp:** " << ts << "\n";
                md << "- **Link:** [" << ts << "](" << primary.url << ")\n";
            } else {
                md << "- **Link:** " << primary.url << "\n";
            }
            for (size_t i = 1; i < record->sources.size(); ++i) {
                const SourceRef& also = record->sources[i];
                md << "- **Also asked in:** " << (also.title.empty() ? also.url : also.title);
                if (also.media_timestamp) {
                    md << " at " << format_timestamp(*also.media_timestamp);
                }
                md << " (" << also.url << ")\n";
            }
            md << "\n";
        }
        md << "---\n\n";
    }

    return md.str();
}

} // namespace quarry
