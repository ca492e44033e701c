#pragma once

/**
 * Crash-safe file replacement.
 *
 * Content is written to a sibling temporary file, flushed, and renamed over
 * the target, so readers see either the previous or the new file, never a
 * partial one.
 */

#include <functional>
#include <ostream>
#include <string>

namespace quarry {

/**
 * Replaces path with the bytes written by writer. Parent directories are
 * created as needed. Throws std::runtime_error if any step fails, and
 * rethrows whatever writer throws; the original file is left untouched and
 * the temporary file is removed in both cases.
 */
void write_file_atomically(const std::string& path,
                           const std::function<void(std::ostream&)>& writer,
                           bool binary = false);

} // namespace quarry
