#include "schedfmt/core/utils.hpp"

#include <fstream>

namespace schedfmt::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto starts_with(std::string_view s, std::string_view prefix) -> bool {
    return s.starts_with(prefix);
}

auto read_lines(const std::filesystem::path& path) -> Result<std::vector<std::string>> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open file", path.string()));
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }

    if (file.bad()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Failed reading file", path.string()));
    }
    return lines;
}

} // namespace schedfmt::utils
