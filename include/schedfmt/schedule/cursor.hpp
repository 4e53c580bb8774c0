#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "schedfmt/core/error.hpp"

namespace schedfmt::schedule {

/// Read position over an in-memory schedule string.
///
/// A Cursor never owns the input; it is cheap to copy, and `save()` /
/// `rewind()` give the explicit "try and rewind on failure" operation used
/// for the optional schedule sections.
class Cursor {
public:
    explicit Cursor(std::string_view input) noexcept : input_(input) {}

    [[nodiscard]] auto input() const noexcept -> std::string_view { return input_; }
    [[nodiscard]] auto position() const noexcept -> std::size_t { return pos_; }
    [[nodiscard]] auto at_end() const noexcept -> bool { return pos_ >= input_.size(); }
    [[nodiscard]] auto remaining() const noexcept -> std::string_view { return input_.substr(pos_); }

    /// Current character, or '\0' at end of input.
    [[nodiscard]] auto peek() const noexcept -> char { return at_end() ? '\0' : input_[pos_]; }

    [[nodiscard]] auto peek_digit() const noexcept -> bool {
        auto c = peek();
        return c >= '0' && c <= '9';
    }

    [[nodiscard]] auto save() const noexcept -> std::size_t { return pos_; }
    void rewind(std::size_t saved) noexcept { pos_ = saved; }

    /// Consumes `c` if it is the current character.
    auto consume(char c) noexcept -> bool;

    /// Consumes `c` or fails with UnexpectedToken at the current offset.
    auto expect(char c) -> VoidResult;

    /// Reads a run of decimal digits.
    ///
    /// Fails with UnexpectedToken if no digit is present and with
    /// NumericOverflow if the run does not fit an `int`.
    auto scan_number() -> Result<int>;

    /// Fails with TrailingInput unless the whole input has been consumed.
    auto expect_end() const -> VoidResult;

private:
    std::string_view input_;
    std::size_t pos_ = 0;
};

/// Human-readable name of a character for error messages.
auto describe_char(char c) -> std::string;

} // namespace schedfmt::schedule
