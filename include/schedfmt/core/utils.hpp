#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "schedfmt/core/error.hpp"

namespace schedfmt::utils {

auto trim(std::string_view s) -> std::string;
auto starts_with(std::string_view s, std::string_view prefix) -> bool;

/// Reads a text file into lines, without trailing newline characters.
auto read_lines(const std::filesystem::path& path) -> Result<std::vector<std::string>>;

} // namespace schedfmt::utils
