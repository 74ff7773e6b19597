#include "output_parser.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <regex>
#include <string>

namespace dbxfer::core {

namespace {

constexpr auto icase = std::regex::ECMAScript | std::regex::icase;

const std::regex& paren_percent() {
    static const std::regex re(R"(\((\d{1,3})%\))");
    return re;
}
const std::regex& percent_complete() {
    static const std::regex re(R"((\d{1,3})%\s+complete)", icase);
    return re;
}
const std::regex& transferred_percent() {
    static const std::regex re(R"(transferred\s+(\d{1,3})%)", icase);
    return re;
}
const std::regex& files_summary_percent() {
    static const std::regex re(R"(\d+\s+files?\s+(?:pulled|pushed).*?\((\d{1,3})%\))", icase);
    return re;
}
const std::regex& fraction() {
    static const std::regex re(R"((\d+)\s*/\s*(\d+))");
    return re;
}
const std::regex& transferring_label() {
    static const std::regex re(R"(transferr?ing)", icase);
    return re;
}
const std::regex& bare_percent() {
    static const std::regex re(R"((\d{1,3})%)");
    return re;
}
const std::regex& bytes_summary() {
    static const std::regex re(R"(\(\s*\d+\s+bytes\b)");
    return re;
}
const std::regex& file_count() {
    static const std::regex re(R"((\d+)\s+(files?)\s+(?:pulled|pushed))", icase);
    return re;
}

auto clamp_percent(long long value) -> int {
    return static_cast<int>(std::clamp<long long>(value, 0, 100));
}

template<typename T>
auto to_number(const std::ssub_match& m) -> std::optional<T> {
    T value{};
    const char* first = &*m.first;
    const char* last = first + m.length();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

auto search_percent(const std::string& text, const std::regex& re) -> std::optional<int> {
    std::smatch m;
    if (!std::regex_search(text, m, re)) {
        return std::nullopt;
    }
    auto value = to_number<int>(m[1]);
    if (!value) {
        return std::nullopt;
    }
    return clamp_percent(*value);
}

auto parse_fraction(const std::string& text) -> std::optional<int> {
    std::smatch m;
    if (!std::regex_search(text, m, fraction())) {
        return std::nullopt;
    }
    auto done = to_number<std::uint64_t>(m[1]);
    auto total = to_number<std::uint64_t>(m[2]);
    if (!done || !total || *total == 0) {
        return std::nullopt;
    }
    if (*done >= *total) {
        return 100;
    }
    // floor(A/B*100) без потери точности, пока A*100 помещается в uint64
    if (*done <= std::numeric_limits<std::uint64_t>::max() / 100) {
        return clamp_percent(static_cast<long long>(*done * 100 / *total));
    }
    const long double ratio = static_cast<long double>(*done) / static_cast<long double>(*total);
    return clamp_percent(static_cast<long long>(ratio * 100.0L));
}

} // namespace

auto parse_progress(std::string_view line) noexcept -> std::optional<int> {
    try {
        const std::string text(line);

        for (const auto* re : {&paren_percent(), &percent_complete(),
                               &transferred_percent(), &files_summary_percent()}) {
            if (auto pct = search_percent(text, *re)) {
                return pct;
            }
        }

        if (auto pct = parse_fraction(text)) {
            return pct;
        }

        if (std::regex_search(text, transferring_label())) {
            if (auto pct = search_percent(text, bare_percent())) {
                return pct;
            }
        }

        if (std::regex_search(text, bytes_summary())) {
            return 100;
        }
    } catch (const std::exception&) {
        // std::regex может бросить на патологическом вводе; строка просто без сигнала
    }
    return std::nullopt;
}

auto parse_file_count(std::string_view line) noexcept -> std::optional<FileCountSignal> {
    try {
        const std::string text(line);
        std::smatch m;
        if (!std::regex_search(text, m, file_count())) {
            return std::nullopt;
        }
        auto count = to_number<std::uint64_t>(m[1]);
        if (!count) {
            return std::nullopt;
        }
        const bool plural = m[2].length() == 5; // "files"
        if (!plural && *count == 1) {
            return FileCountSignal{.count = 1, .absolute = false};
        }
        return FileCountSignal{.count = *count, .absolute = true};
    } catch (const std::exception&) {
        // как и в parse_progress: нет совпадения
    }
    return std::nullopt;
}

} // namespace dbxfer::core
