#include "schedfmt/schedule/cursor.hpp"

#include <charconv>
#include <string>

namespace schedfmt::schedule {

auto describe_char(char c) -> std::string {
    if (c == '\0') return "end of input";
    if (c == ' ') return "' ' (space)";
    return std::string("'") + c + "'";
}

auto Cursor::consume(char c) noexcept -> bool {
    if (at_end() || input_[pos_] != c) return false;
    ++pos_;
    return true;
}

auto Cursor::expect(char c) -> VoidResult {
    if (consume(c)) return {};
    return std::unexpected(make_error(
        ErrorCode::UnexpectedToken,
        "Expected " + describe_char(c),
        "found " + describe_char(peek())).at(pos_));
}

auto Cursor::scan_number() -> Result<int> {
    auto start = pos_;
    auto stop = start;
    while (stop < input_.size() && input_[stop] >= '0' && input_[stop] <= '9') {
        ++stop;
    }

    if (stop == start) {
        return std::unexpected(make_error(
            ErrorCode::UnexpectedToken,
            "Expected digit",
            "found " + describe_char(peek())).at(start));
    }

    int value = 0;
    auto digits = input_.substr(start, stop - start);
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(make_error(
            ErrorCode::NumericOverflow,
            "Number does not fit a 32-bit integer",
            std::string(digits)).at(start));
    }
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::unexpected(make_error(
            ErrorCode::UnexpectedToken,
            "Invalid number",
            std::string(digits)).at(start));
    }

    pos_ = stop;
    return value;
}

auto Cursor::expect_end() const -> VoidResult {
    if (at_end()) return {};
    return std::unexpected(make_error(
        ErrorCode::TrailingInput,
        "Unexpected trailing input",
        std::string(remaining())).at(pos_));
}

} // namespace schedfmt::schedule
