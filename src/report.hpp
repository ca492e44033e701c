#pragma once

/**
 * Markdown export of a subject's question index.
 */

#include "question_record.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace quarry {

// Formats seconds as MM:SS; minutes are not wrapped into hours.
std::string format_timestamp(double seconds);

// Formats a Unix time as "YYYY-MM-DD HH:MM:SS UTC".
std::string format_utc(int64_t unix_seconds);

/**
 * Renders records as a markdown report grouped by primary source, in the
 * order sources first appear. Each question lists its timestamp when
 * known, and any further sources a merged record was asked in.
 */
std::string render_markdown_report(const std::string& subject,
                                   const std::vector<QuestionRecord>& records,
                                   int64_t generated_at);

} // namespace quarry
