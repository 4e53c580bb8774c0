#pragma once

#include "schedfmt/core/error.hpp"
#include "schedfmt/schedule/cursor.hpp"
#include "schedfmt/schedule/types.hpp"

namespace schedfmt::schedule {

/// Parse one interval unit at the cursor.
///
/// Grammar:
///   number        := digit+
///   interval      := number ('-' number)?
///   wholeInterval := ('*' | interval) ('/' number)?
///
/// Once '-' or '/' is consumed the number after it is mandatory. A step of
/// zero fails with InvalidStep.
auto parse_whole_interval(Cursor& cursor) -> Result<ScheduleEntry>;

/// Parse a comma-separated list of interval units.
///
/// Grammar: wholeInterval (',' wholeInterval)* ','?
///
/// A trailing comma is accepted when the character after it cannot start
/// an interval. When `check_wildcards` is set, a list of more than one
/// entry containing the bare wildcard fails with WildcardConflict; the
/// caller attaches the field name.
auto parse_interval_sequence(Cursor& cursor, bool check_wildcards = true) -> Result<EntrySequence>;

/// True if the list combines the bare wildcard with other entries.
auto has_wildcard_conflict(const EntrySequence& entries) -> bool;

} // namespace schedfmt::schedule
