#include "schedfmt/schedule/parser.hpp"
#include "schedfmt/core/logger.hpp"
#include "schedfmt/schedule/interval.hpp"

#include <algorithm>
#include <optional>
#include <type_traits>
#include <utility>

namespace schedfmt::schedule {

namespace {

template <typename T>
auto parse_whole(std::string_view input, Result<T> (*parse)(Cursor&, Validation)) -> Result<T> {
    Cursor cursor(input);
    auto value = parse(cursor, Validation::Enabled);
    if (!value) return std::unexpected(value.error());

    if (auto end = cursor.expect_end(); !end) return std::unexpected(end.error());
    return value;
}

/// Attempt an optional section followed by a single space.
///
/// On any failure the cursor is restored and std::nullopt returned. When
/// the failure was a validation error, the section is re-scanned without
/// validation; if that matches up to and including the space, the error is
/// stored in `deferred` so it can be reported should the time section fail.
/// With `defer_separator` set, a section that is complete but not followed by
/// the space defers its error too: the validation error if it has one,
/// otherwise the missing separator.
template <typename Parse>
auto try_section(Cursor& cursor, std::string_view name, Parse parse,
                 std::optional<Error>& deferred, bool defer_separator = false)
    -> std::optional<typename std::invoke_result_t<Parse, Cursor&, Validation>::value_type>
{
    auto saved = cursor.save();

    auto value = parse(cursor, Validation::Enabled);
    if (value) {
        auto space = cursor.expect(' ');
        if (space) {
            LOG_TRACE("{} section parsed, offset {} -> {}", name, saved, cursor.position());
            return std::move(*value);
        }
        cursor.rewind(saved);
        LOG_DEBUG("{} section absent at offset {}: {}", name, saved, space.error().what());
        if (defer_separator && !deferred) {
            deferred = std::move(space.error());
        }
        return std::nullopt;
    }

    cursor.rewind(saved);
    LOG_DEBUG("{} section absent at offset {}: {}", name, saved, value.error().what());

    if (is_validation_error(value.error()) && !deferred) {
        auto syntax = parse(cursor, Validation::SyntaxOnly);
        if (syntax && (cursor.consume(' ') || defer_separator)) {
            deferred = std::move(value.error());
        }
        cursor.rewind(saved);
    }
    return std::nullopt;
}

} // anonymous namespace

auto parse_field(Cursor& cursor, Field field, Validation validation) -> Result<EntrySequence> {
    const auto& bounds = field_bounds(field);
    auto start = cursor.position();
    bool validate = validation == Validation::Enabled;

    auto entries = parse_interval_sequence(cursor, validate);
    if (!entries) {
        auto err = std::move(entries.error());
        if (err.code() == ErrorCode::WildcardConflict) {
            err.set_detail(std::string(bounds.label));
        }
        return std::unexpected(std::move(err));
    }

    if (validate) {
        auto checked = validate_bounds(*entries, bounds.label, bounds.min, bounds.max);
        if (!checked) return std::unexpected(std::move(checked.error()).at(start));
    }
    return entries;
}

auto parse_date(Cursor& cursor, Validation validation) -> Result<ScheduleDate> {
    auto years = parse_field(cursor, Field::Year, validation);
    if (!years) return std::unexpected(years.error());
    if (auto sep = cursor.expect('.'); !sep) return std::unexpected(sep.error());

    auto months = parse_field(cursor, Field::Month, validation);
    if (!months) return std::unexpected(months.error());
    if (auto sep = cursor.expect('.'); !sep) return std::unexpected(sep.error());

    auto days = parse_field(cursor, Field::Day, validation);
    if (!days) return std::unexpected(days.error());

    return ScheduleDate{
        .years = std::move(*years),
        .months = std::move(*months),
        .days = std::move(*days),
    };
}

auto parse_day_of_week(Cursor& cursor, Validation validation) -> Result<EntrySequence> {
    return parse_field(cursor, Field::DayOfWeek, validation);
}

auto parse_time(Cursor& cursor, Validation validation) -> Result<ScheduleTime> {
    auto hours = parse_field(cursor, Field::Hour, validation);
    if (!hours) return std::unexpected(hours.error());
    if (auto sep = cursor.expect(':'); !sep) return std::unexpected(sep.error());

    auto minutes = parse_field(cursor, Field::Minute, validation);
    if (!minutes) return std::unexpected(minutes.error());
    if (auto sep = cursor.expect(':'); !sep) return std::unexpected(sep.error());

    auto seconds = parse_field(cursor, Field::Second, validation);
    if (!seconds) return std::unexpected(seconds.error());

    // Once the '.' is consumed the millisecond field is mandatory.
    EntrySequence millis{ScheduleEntry::single_point(0)};
    if (cursor.consume('.')) {
        auto parsed = parse_field(cursor, Field::Millisecond, validation);
        if (!parsed) return std::unexpected(parsed.error());
        millis = std::move(*parsed);
    }

    return ScheduleTime{
        .hours = std::move(*hours),
        .minutes = std::move(*minutes),
        .seconds = std::move(*seconds),
        .milliseconds = std::move(millis),
    };
}

auto parse_date(std::string_view input) -> Result<ScheduleDate> {
    return parse_whole<ScheduleDate>(input, &parse_date);
}

auto parse_day_of_week(std::string_view input) -> Result<EntrySequence> {
    return parse_whole<EntrySequence>(input, &parse_day_of_week);
}

auto parse_time(std::string_view input) -> Result<ScheduleTime> {
    return parse_whole<ScheduleTime>(input, &parse_time);
}

auto parse_schedule(std::string_view input) -> Result<ScheduleFormat> {
    Cursor cursor(input);
    std::optional<Error> deferred;

    // A complete date can never start a valid time, so a missing space
    // after it is the error worth reporting.
    auto date = try_section(cursor, "Date",
        [](Cursor& c, Validation v) { return parse_date(c, v); }, deferred, true);

    auto day_of_week = try_section(cursor, "Day of week",
        [](Cursor& c, Validation v) { return parse_day_of_week(c, v); }, deferred);

    auto time = parse_time(cursor, Validation::Enabled);
    if (!time) {
        if (deferred) {
            LOG_DEBUG("Time section failed ({}), reporting earlier section error",
                      time.error().what());
            return std::unexpected(std::move(*deferred));
        }
        return std::unexpected(time.error());
    }

    if (auto end = cursor.expect_end(); !end) return std::unexpected(end.error());

    return ScheduleFormat{
        .date = date ? std::move(*date) : ScheduleDate::always(),
        .day_of_week = day_of_week ? std::move(*day_of_week)
                                   : EntrySequence{ScheduleEntry::always()},
        .time = std::move(*time),
    };
}

auto format_error_location(std::string_view input, const Error& err) -> std::string {
    auto offset = err.offset();
    if (!offset) return {};

    auto column = std::min(*offset, input.size());
    std::string out(input);
    out += '\n';
    out.append(column, ' ');
    out += '^';
    return out;
}

} // namespace schedfmt::schedule
