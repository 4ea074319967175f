#include "specread/io/text_file.hpp"
#include <zlib.h>
#include <memory>

namespace specread {
namespace io {

namespace {

struct GzFileCloser {
    void operator()(gzFile_s* file) const noexcept { gzclose(file); }
};

using GzFilePtr = std::unique_ptr<gzFile_s, GzFileCloser>;

constexpr unsigned kReadChunk = 64 * 1024;

} // namespace

std::string readTextFile(const std::string& filename) {
    GzFilePtr file(gzopen(filename.c_str(), "rb"));
    if (!file) {
        throw IoError("Failed to open file: " + filename);
    }

    std::string content;
    std::string chunk(kReadChunk, '\0');
    while (true) {
        int n = gzread(file.get(), &chunk[0], kReadChunk);
        if (n < 0) {
            int errnum = 0;
            const char* msg = gzerror(file.get(), &errnum);
            throw IoError("Failed to read file: " + filename + " (" +
                          (msg ? msg : "unknown error") + ")");
        }
        if (n == 0) break;
        content.append(chunk.data(), static_cast<std::size_t>(n));
    }
    return content;
}

std::string normalizeNewlines(const std::string& content) {
    std::string result;
    result.reserve(content.size());
    for (std::size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\r') {
            result.push_back('\n');
            if (i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
        } else {
            result.push_back(c);
        }
    }
    return result;
}

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    std::string normalized = normalizeNewlines(content);

    std::size_t start = 0;
    while (start < normalized.size()) {
        std::size_t end = normalized.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(normalized.substr(start));
            break;
        }
        lines.push_back(normalized.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

} // namespace io
} // namespace specread
