#pragma once

#include <array>
#include <string_view>

#include "schedfmt/core/error.hpp"
#include "schedfmt/schedule/types.hpp"

namespace schedfmt::schedule {

enum class Field {
    Year,
    Month,
    Day,
    DayOfWeek,
    Hour,
    Minute,
    Second,
    Millisecond,
};

struct FieldBounds {
    Field field;
    std::string_view label;
    int min;
    int max;
};

/// Permitted values per field. Day 32 stands for "last day of month";
/// day of week 0 is Sunday.
inline constexpr std::array<FieldBounds, 8> kFieldBounds = {{
    {Field::Year,        "Year",        2000, 2100},
    {Field::Month,       "Month",       1,    12},
    {Field::Day,         "Day",         1,    32},
    {Field::DayOfWeek,   "Day of week", 0,    6},
    {Field::Hour,        "Hour",        0,    23},
    {Field::Minute,      "Minute",      0,    59},
    {Field::Second,      "Second",      0,    59},
    {Field::Millisecond, "Millisecond", 0,    999},
}};

constexpr auto field_bounds(Field field) -> const FieldBounds& {
    return kFieldBounds[static_cast<std::size_t>(field)];
}

/// Check every entry against [min, max].
///
/// Wildcards always pass. A single point is checked as `begin-begin`.
/// Stops at the first offending entry and reports it as
/// "<label> component (<begin>, <end>) is out of bounds (<min>, <max>)".
auto validate_bounds(const EntrySequence& entries, std::string_view label, int min, int max)
    -> VoidResult;

auto validate_bounds(const EntrySequence& entries, Field field) -> VoidResult;

void to_json(json& j, const FieldBounds& b);

} // namespace schedfmt::schedule
