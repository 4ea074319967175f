#pragma once

#include "../types.hpp"
#include "../errors.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace specread {
namespace io {

/**
 * @brief How the delimiter of a file was determined.
 */
enum class DelimiterSource : std::uint8_t {
    TAB,            // Content contains a tab character
    COMMA_SPACE,    // Content contains ", "
    SEMICOLON,      // Content contains ';'
    USER            // Entered by the user after detection failed
};

/**
 * @brief Field delimiter and decimal convention of a text export.
 */
struct Dialect {
    /// Field delimiter (may be longer than one character)
    std::string delimiter;

    /// Replace ',' by '.' in every line before splitting
    bool rewrite_decimal_comma = false;

    DelimiterSource source = DelimiterSource::TAB;

    bool operator==(const Dialect& other) const {
        return delimiter == other.delimiter &&
               rewrite_decimal_comma == other.rewrite_decimal_comma &&
               source == other.source;
    }
};

/**
 * @brief Asks the user for a delimiter when automatic detection fails.
 *
 * Receives the display name of the file. Returns std::nullopt if the user
 * declined.
 */
using DelimiterPrompt =
    std::function<std::optional<std::string>(const std::string& display_name)>;

/**
 * @brief Options for format sniffing.
 */
struct FormatSnifferOptions {
    /// Fallback when no delimiter is detected (nullptr = fail immediately)
    DelimiterPrompt prompt = nullptr;

    /// Name passed to the prompt
    std::string display_name;
};

/**
 * @brief Sniffed dialect together with the split rows.
 */
struct SniffResult {
    Dialect dialect;
    std::vector<RawRow> rows;
};

/**
 * @brief Detects delimiter and decimal separator of instrument exports.
 *
 * Detection looks at the whole file content, first match wins:
 *  1. a tab anywhere            -> tab, decimal commas rewritten
 *  2. ", " anywhere             -> ", ", no rewriting
 *  3. ';' anywhere              -> ';', decimal commas rewritten
 *  4. otherwise ask the prompt; a delimiter containing '.' is rejected, one
 *     containing ',' disables decimal rewriting.
 *
 * Tab strictly takes precedence over the other two, so files mixing
 * separators are read the way the instruments write them.
 *
 * Usage:
 * @code
 * FormatSniffer sniffer;
 * auto result = sniffer.sniff(content, splitLines(content));
 * @endcode
 */
class FormatSniffer {
public:
    FormatSniffer() = default;
    explicit FormatSniffer(FormatSnifferOptions options)
        : options_(std::move(options)) {}

    /**
     * @brief Detect the dialect without asking the user.
     *
     * @param content Whole file content
     * @return Detected dialect, nullopt if no rule matched
     */
    [[nodiscard]] static std::optional<Dialect> detect(const std::string& content);

    /**
     * @brief Build a dialect from a user supplied delimiter.
     *
     * @return nullopt if the delimiter is empty or contains '.'
     */
    [[nodiscard]] static std::optional<Dialect> userDialect(const std::string& delimiter);

    /**
     * @brief Detect the dialect and split every line.
     *
     * @param content Whole file content
     * @param lines Lines of @p content without terminators
     * @return Dialect and rows
     * @throws FormatError if no dialect was detected and the prompt is
     *         missing, declined, or returned an invalid delimiter
     */
    SniffResult sniff(const std::string& content,
                      const std::vector<std::string>& lines) const;

    /**
     * @brief Split one line according to a dialect.
     *
     * Empty fields are kept; an empty line yields one empty cell.
     */
    [[nodiscard]] static RawRow splitRow(const std::string& line, const Dialect& dialect);

    const FormatSnifferOptions& options() const { return options_; }
    void setOptions(FormatSnifferOptions opt) { options_ = std::move(opt); }

private:
    FormatSnifferOptions options_;

    Dialect promptDialect() const;
};

/**
 * @brief Convenience function for sniffing a file's content.
 */
inline SniffResult sniffFormat(const std::string& content,
                               const std::vector<std::string>& lines,
                               FormatSnifferOptions options = {}) {
    FormatSniffer sniffer(std::move(options));
    return sniffer.sniff(content, lines);
}

/// Convert delimiter source to string
inline std::string toString(DelimiterSource s) {
    switch (s) {
        case DelimiterSource::TAB: return "tab";
        case DelimiterSource::COMMA_SPACE: return "comma-space";
        case DelimiterSource::SEMICOLON: return "semicolon";
        case DelimiterSource::USER: return "user";
        default: return "unknown";
    }
}

} // namespace io
} // namespace specread
