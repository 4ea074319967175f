#pragma once

#include "../errors.hpp"
#include <string>
#include <vector>

namespace specread {
namespace io {

/**
 * @brief Read a whole text export into memory.
 *
 * The file is read through zlib's gz stream interface, so gzip-compressed
 * exports (e.g. "sample.txt.gz") are inflated transparently and plain files
 * are returned unchanged.
 *
 * @param filename Path to the file
 * @return File content as bytes
 * @throws IoError if the file cannot be opened or read
 */
std::string readTextFile(const std::string& filename);

/**
 * @brief Convert "\r\n" and "\r" line terminators to "\n".
 */
std::string normalizeNewlines(const std::string& content);

/**
 * @brief Split text into lines.
 *
 * Accepts "\n", "\r\n" and "\r" as terminators and strips them. A trailing
 * terminator does not start an additional empty line; blank lines inside
 * the text are kept as empty strings.
 *
 * @param content Text to split
 * @return Lines without terminators
 */
std::vector<std::string> splitLines(const std::string& content);

} // namespace io
} // namespace specread
