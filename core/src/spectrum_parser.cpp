#include "specread/io/spectrum_parser.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <regex>
#include <string_view>
#include <system_error>

namespace specread {
namespace io {

namespace {

constexpr const char* kWhitespace = " \t\n\r\f\v";

std::string toLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

/// Decimal exponent of the leading significant digit of a numeric literal
long leadingExponent(std::string_view literal) {
    const auto e = literal.find_first_of("eE");
    const std::string_view mantissa = literal.substr(0, e);

    long exponent = 0;
    if (e != std::string_view::npos) {
        exponent = std::strtol(std::string(literal.substr(e + 1)).c_str(), nullptr, 10);
    }

    auto point = mantissa.find('.');
    if (point == std::string_view::npos) {
        point = mantissa.size();
    }
    const auto first = mantissa.find_first_of("123456789");
    if (first == std::string_view::npos) {
        return 0;
    }
    const long position = first < point ? static_cast<long>(point - first - 1)
                                        : -static_cast<long>(first - point);
    return position + exponent;
}

std::string joinCells(const RawRow& row) {
    std::string joined;
    for (const auto& cell : row) {
        joined += cell;
    }
    return joined;
}

} // namespace

// =============================================================================
// Field rules
// =============================================================================

FieldRule labelRule(const std::string& pattern,
                    std::function<std::string(std::string)> transform) {
    std::regex label(pattern, std::regex::ECMAScript | std::regex::icase);
    return [label, transform](const HeaderBlock& header) -> std::optional<std::string> {
        for (const auto& row : header.rows) {
            if (row.empty() || !std::regex_search(row.front(), label)) continue;
            std::string value = row.back();
            return transform ? transform(std::move(value)) : value;
        }
        return std::nullopt;
    };
}

FieldRule firstRowPatternRule(const std::string& pattern) {
    std::regex re(pattern);
    return [re](const HeaderBlock& header) -> std::optional<std::string> {
        if (header.empty()) {
            return std::nullopt;
        }
        // First header row only, later rows are never searched
        std::string text = joinCells(header.rows.front());
        std::smatch match;
        if (std::regex_search(text, match, re)) {
            return match.str(0);
        }
        return std::nullopt;
    };
}

FieldRule lastRowRule() {
    return [](const HeaderBlock& header) -> std::optional<std::string> {
        if (header.empty() || header.rows.back().empty()) {
            return std::nullopt;
        }
        return header.rows.back().back();
    };
}

std::optional<std::string> applyRules(const std::vector<FieldRule>& rules,
                                      const HeaderBlock& header) {
    for (const auto& rule : rules) {
        if (auto value = rule(header)) {
            return value;
        }
    }
    return std::nullopt;
}

std::vector<FieldRule> SpectrumParser::dateRules() {
    return {
        labelRule("date|Datum| am", [](std::string value) {
            std::replace(value.begin(), value.end(), '/', '.');
            return value;
        }),
        firstRowPatternRule("[0-9]{2}[./][0-9]{2}[./][0-9]{4}"),
    };
}

std::vector<FieldRule> SpectrumParser::timeRules() {
    return {
        labelRule("time|Zeit| um"),
        firstRowPatternRule("[0-9]{2}:[0-9]{2}:[0-9]{2}"),
    };
}

std::vector<FieldRule> SpectrumParser::modeRules() {
    return {
        labelRule("YUNITS|Modus"),
        lastRowRule(),
    };
}

// =============================================================================
// Parser
// =============================================================================

std::optional<double> SpectrumParser::parseNumber(const std::string& text) {
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto last = text.find_last_not_of(kWhitespace);
    std::string_view sv(text.data() + first, last - first + 1);

    bool negative = false;
    if (sv.front() == '+' || sv.front() == '-') {
        negative = sv.front() == '-';
        sv.remove_prefix(1);
    }
    if (sv.empty()) {
        return std::nullopt;
    }

    std::string word = toLower(sv);
    if (word == "nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (word == "inf" || word == "infinity") {
        return negative ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }

    // from_chars would also take "infinity" spellings and a second sign
    if (!std::isdigit(static_cast<unsigned char>(sv.front())) && sv.front() != '.') {
        return std::nullopt;
    }

    double value = 0.0;
    const char* end = sv.data() + sv.size();
    auto [ptr, ec] = std::from_chars(sv.data(), end, value, std::chars_format::general);
    if (ptr != end) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        // Overflow saturates to infinity, underflow to zero
        value = leadingExponent(sv) > 0 ? std::numeric_limits<double>::infinity() : 0.0;
    } else if (ec != std::errc()) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

std::optional<Index> SpectrumParser::findDataStart(const std::vector<RawRow>& rows) {
    for (Index i = 0; i < rows.size(); ++i) {
        if (!rows[i].empty() && parseNumber(rows[i].front())) {
            return i;
        }
    }
    return std::nullopt;
}

SpectrumHeader SpectrumParser::extractHeader(std::vector<RawRow> header_rows) const {
    SpectrumHeader header;
    header.title = options_.unknown_value;
    header.date = options_.unknown_value;
    header.time = options_.unknown_value;
    header.mode = options_.unknown_mode;

    if (header_rows.empty()) {
        return header;
    }

    HeaderBlock block;
    block.rows = std::move(header_rows);
    for (auto& row : block.rows) {
        if (row.size() < 2) {
            row.resize(2);
        }
        header.metadata.emplace_back(row.front(), row.back());
    }

    header.title = block.rows.front().back();
    header.date = applyRules(dateRules(), block).value_or(options_.unknown_value);
    header.time = applyRules(timeRules(), block).value_or(options_.unknown_value);
    header.mode = applyRules(modeRules(), block).value_or(options_.unknown_mode);

    spdlog::debug("spectrum_parser: title '{}', date '{}', time '{}', mode '{}'",
                  header.title, header.date, header.time, header.mode);
    return header;
}

Spectrum SpectrumParser::parse(const std::vector<RawRow>& rows,
                               const std::string& source_path) const {
    const std::string name = Spectrum::displayNameFor(source_path);

    auto data_start = findDataStart(rows);
    if (!data_start) {
        throw FormatError("no numeric data found in '" + name + "'");
    }
    spdlog::debug("spectrum_parser: {} has {} header rows and {} data rows",
                  name, *data_start, rows.size() - *data_start);

    SpectrumHeader header = extractHeader(
        std::vector<RawRow>(rows.begin(), rows.begin() + *data_start));

    std::vector<Wavelength> wavelength;
    std::vector<Intensity> intensity;
    wavelength.reserve(rows.size() - *data_start);
    intensity.reserve(rows.size() - *data_start);

    for (Index i = *data_start; i < rows.size(); ++i) {
        const RawRow& row = rows[i];
        std::optional<double> x = row.empty() ? std::nullopt : parseNumber(row.front());
        if (!x) {
            throw FormatError("line " + std::to_string(i + 1) + " of '" + name +
                              "': wavelength '" + (row.empty() ? "" : row.front()) +
                              "' is not a number");
        }
        std::optional<double> y = row.size() > 1 ? parseNumber(row[1]) : std::nullopt;

        wavelength.push_back(*x);
        intensity.push_back(y ? *y : kMissingIntensity);
    }

    Spectrum spectrum(source_path, std::move(wavelength), std::move(intensity),
                      std::move(header));

    if (!spectrum.intensityRange()) {
        if (!options_.allow_degenerate_intensity) {
            throw DegenerateDataError("every intensity value of '" + name + "' is NaN");
        }
        spdlog::warn("spectrum_parser: every intensity value of {} is NaN", name);
    }
    return spectrum;
}

} // namespace io
} // namespace specread
