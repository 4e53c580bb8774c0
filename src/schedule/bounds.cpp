#include "schedfmt/schedule/bounds.hpp"

#include <string>

namespace schedfmt::schedule {

auto validate_bounds(const EntrySequence& entries, std::string_view label, int min, int max)
    -> VoidResult
{
    for (const auto& entry : entries) {
        auto begin = entry.begin_value();
        if (!begin) continue;

        int end = entry.end_value().value_or(*begin);
        if (*begin < min || *begin > max || end < *begin || end > max) {
            return std::unexpected(make_error(
                ErrorCode::OutOfBounds,
                std::string(label) + " component (" + std::to_string(*begin) + ", " +
                    std::to_string(end) + ") is out of bounds (" + std::to_string(min) +
                    ", " + std::to_string(max) + ")"));
        }
    }
    return {};
}

auto validate_bounds(const EntrySequence& entries, Field field) -> VoidResult {
    const auto& bounds = field_bounds(field);
    return validate_bounds(entries, bounds.label, bounds.min, bounds.max);
}

void to_json(json& j, const FieldBounds& b) {
    j = json{
        {"field", std::string(b.label)},
        {"min", b.min},
        {"max", b.max},
    };
}

} // namespace schedfmt::schedule
