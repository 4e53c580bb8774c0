#pragma once

#include <string>
#include <string_view>

#include "schedfmt/core/error.hpp"
#include "schedfmt/schedule/bounds.hpp"
#include "schedfmt/schedule/cursor.hpp"
#include "schedfmt/schedule/types.hpp"

namespace schedfmt::schedule {

/// Whether field parsers run bounds and wildcard checks. SyntaxOnly is
/// used to decide which optional section an input was meant to contain.
enum class Validation {
    Enabled,
    SyntaxOnly,
};

/// Parse an interval sequence and validate it against `field`'s bounds.
/// Validation errors carry the field label and the offset of the field.
auto parse_field(Cursor& cursor, Field field, Validation validation = Validation::Enabled)
    -> Result<EntrySequence>;

/// Date := Year '.' Month '.' Day
auto parse_date(Cursor& cursor, Validation validation = Validation::Enabled)
    -> Result<ScheduleDate>;

/// DayOfWeek := interval sequence in 0-6, 0 being Sunday.
auto parse_day_of_week(Cursor& cursor, Validation validation = Validation::Enabled)
    -> Result<EntrySequence>;

/// Time := Hour ':' Minute ':' Second ('.' Millisecond)?
///
/// Milliseconds default to a single point 0 when the suffix is absent.
auto parse_time(Cursor& cursor, Validation validation = Validation::Enabled)
    -> Result<ScheduleTime>;

/// Whole-string variants of the section parsers; the entire input must be
/// consumed.
auto parse_date(std::string_view input) -> Result<ScheduleDate>;
auto parse_day_of_week(std::string_view input) -> Result<EntrySequence>;
auto parse_time(std::string_view input) -> Result<ScheduleTime>;

/// Parse a full schedule string.
///
/// Accepted shapes:
///   yyyy.MM.dd w HH:mm:ss.fff
///   yyyy.MM.dd HH:mm:ss.fff
///   w HH:mm:ss.fff
///   HH:mm:ss.fff
/// and the same without the `.fff` suffix. Every field is a comma-separated
/// list of `*`, `N` or `N-M`, each optionally followed by `/step`.
///
/// The date and day-of-week sections are optional: each is attempted and,
/// on any failure, the cursor is rewound and the section treated as absent
/// (defaulting to `*`). The time section is mandatory and the whole input
/// must be consumed.
///
/// If the time section fails and an optional section matched the grammar
/// but failed validation, that validation error is returned instead, since
/// the separators identify it as the intended section.
///
/// @param input  The schedule, e.g. "2023.05.15 3 10:20:30.500".
/// @returns      Parsed ScheduleFormat, or the Error with its input offset.
auto parse_schedule(std::string_view input) -> Result<ScheduleFormat>;

/// Render `input` and a caret under the error offset, e.g.
///
///   10:20:30extra
///           ^
///
/// Returns an empty string if the error carries no offset.
auto format_error_location(std::string_view input, const Error& err) -> std::string;

} // namespace schedfmt::schedule
