#include "schedfmt/schedule/interval.hpp"

#include <algorithm>

namespace schedfmt::schedule {

namespace {

auto can_start_interval(const Cursor& cursor) -> bool {
    return cursor.peek() == '*' || cursor.peek_digit();
}

auto parse_step(Cursor& cursor) -> Result<std::optional<int>> {
    if (!cursor.consume('/')) return std::optional<int>{};

    auto at = cursor.position();
    auto step = cursor.scan_number();
    if (!step) return std::unexpected(step.error());

    if (*step <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidStep,
            "Step must be a positive integer",
            std::to_string(*step)).at(at));
    }
    return std::optional<int>{*step};
}

} // anonymous namespace

auto parse_whole_interval(Cursor& cursor) -> Result<ScheduleEntry> {
    if (cursor.consume('*')) {
        auto step = parse_step(cursor);
        if (!step) return std::unexpected(step.error());
        return ScheduleEntry::wildcard(*step);
    }

    auto begin = cursor.scan_number();
    if (!begin) return std::unexpected(begin.error());

    std::optional<int> end;
    if (cursor.consume('-')) {
        auto value = cursor.scan_number();
        if (!value) return std::unexpected(value.error());
        end = *value;
    }

    auto step = parse_step(cursor);
    if (!step) return std::unexpected(step.error());

    if (end) return ScheduleEntry::range(*begin, *end, *step);
    return ScheduleEntry::single_point(*begin, *step);
}

auto has_wildcard_conflict(const EntrySequence& entries) -> bool {
    return entries.size() > 1 &&
           std::any_of(entries.begin(), entries.end(),
                       [](const ScheduleEntry& e) { return e.is_always(); });
}

auto parse_interval_sequence(Cursor& cursor, bool check_wildcards) -> Result<EntrySequence> {
    auto start = cursor.position();

    EntrySequence entries;
    auto first = parse_whole_interval(cursor);
    if (!first) return std::unexpected(first.error());
    entries.push_back(*first);

    while (cursor.consume(',')) {
        if (!can_start_interval(cursor)) break;  // trailing comma

        auto next = parse_whole_interval(cursor);
        if (!next) return std::unexpected(next.error());
        entries.push_back(*next);
    }

    if (check_wildcards && has_wildcard_conflict(entries)) {
        return std::unexpected(make_error(
            ErrorCode::WildcardConflict,
            "Wildcard cannot be combined with other entries").at(start));
    }
    return entries;
}

} // namespace schedfmt::schedule
