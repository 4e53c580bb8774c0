#include "schedfmt/schedule/types.hpp"

namespace schedfmt {

namespace {

auto optional_to_json(const std::optional<int>& value) -> json {
    return value ? json(*value) : json(nullptr);
}

} // anonymous namespace

auto ScheduleEntry::wildcard(std::optional<int> step) -> ScheduleEntry {
    return ScheduleEntry{Wildcard{}, step};
}

auto ScheduleEntry::single_point(int value, std::optional<int> step) -> ScheduleEntry {
    return ScheduleEntry{SinglePoint{value}, step};
}

auto ScheduleEntry::range(int begin, int end, std::optional<int> step) -> ScheduleEntry {
    return ScheduleEntry{Range{begin, end}, step};
}

auto ScheduleEntry::begin_value() const -> std::optional<int> {
    if (const auto* point = std::get_if<SinglePoint>(&span)) return point->value;
    if (const auto* r = std::get_if<Range>(&span)) return r->begin;
    return std::nullopt;
}

auto ScheduleEntry::end_value() const -> std::optional<int> {
    if (const auto* r = std::get_if<Range>(&span)) return r->end;
    return std::nullopt;
}

auto ScheduleDate::always() -> ScheduleDate {
    return ScheduleDate{
        .years = {ScheduleEntry::always()},
        .months = {ScheduleEntry::always()},
        .days = {ScheduleEntry::always()},
    };
}

void to_json(json& j, const ScheduleEntry& e) {
    j = json{
        {"begin", optional_to_json(e.begin_value())},
        {"end", optional_to_json(e.end_value())},
        {"step", optional_to_json(e.step)},
    };
}

void to_json(json& j, const ScheduleDate& d) {
    j = json{
        {"years", d.years},
        {"months", d.months},
        {"days", d.days},
    };
}

void to_json(json& j, const ScheduleTime& t) {
    j = json{
        {"hours", t.hours},
        {"minutes", t.minutes},
        {"seconds", t.seconds},
        {"milliseconds", t.milliseconds},
    };
}

void to_json(json& j, const ScheduleFormat& f) {
    j = json{
        {"date", f.date},
        {"day_of_week", f.day_of_week},
        {"time", f.time},
    };
}

} // namespace schedfmt
