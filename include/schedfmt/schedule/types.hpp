#pragma once

#include <optional>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace schedfmt {

using json = nlohmann::json;

/// Matches any value of the field.
struct Wildcard {
    auto operator==(const Wildcard&) const -> bool = default;
};

/// A single value. For range checks it behaves as `value-value`.
struct SinglePoint {
    int value = 0;
    auto operator==(const SinglePoint&) const -> bool = default;
};

/// An inclusive range `begin-end`.
struct Range {
    int begin = 0;
    int end = 0;
    auto operator==(const Range&) const -> bool = default;
};

using Span = std::variant<Wildcard, SinglePoint, Range>;

/// One comma-separated unit of a schedule field: a span plus an optional
/// step. The step means "every Nth value starting at begin".
struct ScheduleEntry {
    Span span;
    std::optional<int> step;

    [[nodiscard]] static auto always() -> ScheduleEntry { return ScheduleEntry{}; }
    [[nodiscard]] static auto wildcard(std::optional<int> step) -> ScheduleEntry;
    [[nodiscard]] static auto single_point(int value, std::optional<int> step = std::nullopt) -> ScheduleEntry;
    [[nodiscard]] static auto range(int begin, int end, std::optional<int> step = std::nullopt) -> ScheduleEntry;

    /// Empty for wildcards.
    [[nodiscard]] auto begin_value() const -> std::optional<int>;
    /// Present only for ranges.
    [[nodiscard]] auto end_value() const -> std::optional<int>;

    [[nodiscard]] auto is_wildcard() const -> bool {
        return std::holds_alternative<Wildcard>(span);
    }

    /// True for the bare `*` entry, with no step.
    [[nodiscard]] auto is_always() const -> bool {
        return is_wildcard() && !step.has_value();
    }

    auto operator==(const ScheduleEntry&) const -> bool = default;
};

/// Non-empty, in input order.
using EntrySequence = std::vector<ScheduleEntry>;

struct ScheduleDate {
    EntrySequence years;
    EntrySequence months;
    EntrySequence days;

    /// `*.*.*`, used when the date section is absent.
    [[nodiscard]] static auto always() -> ScheduleDate;

    auto operator==(const ScheduleDate&) const -> bool = default;
};

struct ScheduleTime {
    EntrySequence hours;
    EntrySequence minutes;
    EntrySequence seconds;
    EntrySequence milliseconds;

    auto operator==(const ScheduleTime&) const -> bool = default;
};

struct ScheduleFormat {
    ScheduleDate date;
    EntrySequence day_of_week;
    ScheduleTime time;

    auto operator==(const ScheduleFormat&) const -> bool = default;
};

void to_json(json& j, const ScheduleEntry& e);
void to_json(json& j, const ScheduleDate& d);
void to_json(json& j, const ScheduleTime& t);
void to_json(json& j, const ScheduleFormat& f);

} // namespace schedfmt
