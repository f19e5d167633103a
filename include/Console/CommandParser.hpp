#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One input line split on whitespace: the first token is the verb.
struct Command {
    std::string verb;
    std::vector<std::string> args;

    [[nodiscard]] bool empty() const noexcept { return verb.empty(); }

    // args[index] or nullptr when the line was shorter.
    [[nodiscard]] const std::string* arg(std::size_t index) const noexcept {
        return index < args.size() ? &args[index] : nullptr;
    }
};

Command parse_line(std::string_view line);

// Whole-token parses; nullopt when any character is left over.
std::optional<int> try_parse_int(std::string_view text);
std::optional<std::int64_t> try_parse_long(std::string_view text);
std::optional<double> try_parse_decimal(std::string_view text);

bool iequals(std::string_view a, std::string_view b) noexcept;
std::string uppercase(std::string text);
std::string lowercase(std::string text);
