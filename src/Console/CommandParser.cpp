#include "Console/CommandParser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <sstream>
#include <utility>

namespace {

template <typename T>
std::optional<T> parse_whole(std::string_view text) {
    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+') ++first; // from_chars rejects a leading '+'
    const auto [end, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || end != last || first == last) {
        return std::nullopt;
    }
    return value;
}

} // namespace

Command parse_line(std::string_view line) {
    Command command;
    std::istringstream in{std::string(line)};
    std::string token;
    if (in >> token) {
        command.verb = std::move(token);
        while (in >> token) {
            command.args.push_back(std::move(token));
        }
    }
    return command;
}

std::optional<int> try_parse_int(std::string_view text) {
    return parse_whole<int>(text);
}

std::optional<std::int64_t> try_parse_long(std::string_view text) {
    return parse_whole<std::int64_t>(text);
}

std::optional<double> try_parse_decimal(std::string_view text) {
    auto value = parse_whole<double>(text);
    if (value && !std::isfinite(*value)) return std::nullopt;
    return value;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string uppercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}
