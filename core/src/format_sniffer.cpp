#include "specread/io/format_sniffer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace specread {
namespace io {

std::optional<Dialect> FormatSniffer::detect(const std::string& content) {
    if (content.find('\t') != std::string::npos) {
        return Dialect{"\t", true, DelimiterSource::TAB};
    }
    if (content.find(", ") != std::string::npos) {
        return Dialect{", ", false, DelimiterSource::COMMA_SPACE};
    }
    if (content.find(';') != std::string::npos) {
        return Dialect{";", true, DelimiterSource::SEMICOLON};
    }
    return std::nullopt;
}

std::optional<Dialect> FormatSniffer::userDialect(const std::string& delimiter) {
    if (delimiter.empty() || delimiter.find('.') != std::string::npos) {
        return std::nullopt;
    }
    // A comma in the delimiter means commas cannot be decimal separators
    bool rewrite = delimiter.find(',') == std::string::npos;
    return Dialect{delimiter, rewrite, DelimiterSource::USER};
}

SniffResult FormatSniffer::sniff(const std::string& content,
                                 const std::vector<std::string>& lines) const {
    SniffResult result;

    if (auto detected = detect(content)) {
        result.dialect = *detected;
    } else {
        result.dialect = promptDialect();
    }

    spdlog::debug("format_sniffer: {} uses {} delimiter '{}'{}",
                  options_.display_name, toString(result.dialect.source),
                  result.dialect.delimiter,
                  result.dialect.rewrite_decimal_comma ? ", decimal comma" : "");

    result.rows.reserve(lines.size());
    for (const auto& line : lines) {
        result.rows.push_back(splitRow(line, result.dialect));
    }
    return result;
}

Dialect FormatSniffer::promptDialect() const {
    const std::string& name = options_.display_name;
    if (!options_.prompt) {
        throw FormatError("cannot detect the delimiter of '" + name + "'");
    }

    spdlog::warn("format_sniffer: no known delimiter in {}, asking user", name);
    std::optional<std::string> answer = options_.prompt(name);
    if (!answer) {
        throw FormatError("no delimiter given for '" + name + "'");
    }

    auto dialect = userDialect(*answer);
    if (!dialect) {
        throw FormatError("invalid delimiter '" + *answer + "' for '" + name +
                          "' (must be non-empty and must not contain '.')");
    }
    return *dialect;
}

RawRow FormatSniffer::splitRow(const std::string& line, const Dialect& dialect) {
    std::string text = line;
    if (dialect.rewrite_decimal_comma) {
        std::replace(text.begin(), text.end(), ',', '.');
    }

    RawRow cells;
    const std::string& delim = dialect.delimiter;
    if (delim.empty()) {
        cells.push_back(text);
        return cells;
    }
    std::size_t start = 0;
    while (true) {
        std::size_t pos = text.find(delim, start);
        if (pos == std::string::npos) {
            cells.push_back(text.substr(start));
            break;
        }
        cells.push_back(text.substr(start, pos - start));
        start = pos + delim.size();
    }
    return cells;
}

} // namespace io
} // namespace specread
