/**
 * @file path.cpp
 * @brief Lexical path helpers for link targets and root confinement
 *
 * Nothing here touches the filesystem: symlinks are not resolved, so the
 * results describe the path as written.
 */

#include "keydir/common.hpp"

#include <algorithm>
#include <ranges>
#include <string>
#include <vector>

namespace keydir::common {

namespace {

namespace fs = std::filesystem;

/// A path reduced to its resolved components
struct Lexical
{
    bool absolute = false;
    std::vector<std::string> parts;  ///< No "." entries; ".." only as a leading run
};

[[nodiscard]] Lexical lexical(std::string_view text)
{
    Lexical result{.absolute = is_absolute_path(text), .parts = {}};
    for (auto piece : text | std::views::split('/')) {
        const std::string_view part(piece.begin(), piece.end());
        if (part.empty() || part == ".") {
            continue;
        }
        if (part != "..") {
            result.parts.emplace_back(part);
        } else if (!result.parts.empty() && result.parts.back() != "..") {
            result.parts.pop_back();
        } else if (!result.absolute) {
            // "/.." is "/"; a relative path keeps its leading ".." steps
            result.parts.emplace_back(part);
        }
    }
    return result;
}

[[nodiscard]] std::string render(const std::vector<std::string>& parts, bool absolute)
{
    std::string text = absolute ? "/" : "";
    for (const auto& [i, part] : std::views::enumerate(parts)) {
        if (i > 0) {
            text += '/';
        }
        text += part;
    }
    return text.empty() ? std::string(".") : text;
}

[[nodiscard]] std::size_t leading_ups(const std::vector<std::string>& parts)
{
    return static_cast<std::size_t>(std::ranges::distance(
        parts | std::views::take_while([](const std::string& part) { return part == ".."; })));
}

}  // namespace

bool is_absolute_path(std::string_view path)
{
    return path.starts_with('/');
}

std::string normalize_path(std::string_view input)
{
    const Lexical path = lexical(input);
    return render(path.parts, path.absolute);
}

std::string make_relative(std::string_view path, std::string_view base)
{
    const Lexical to = lexical(path);
    const Lexical from = lexical(base);

    const auto [from_rest, to_rest] = std::ranges::mismatch(from.parts, to.parts);
    std::vector<std::string> steps(static_cast<std::size_t>(from.parts.end() - from_rest), "..");
    steps.insert(steps.end(), to_rest, to.parts.end());
    return render(steps, false);
}

bool is_within(const fs::path& path, const fs::path& root)
{
    const Lexical candidate = lexical(path.string());
    const Lexical boundary = lexical(root.string());
    if (candidate.absolute != boundary.absolute) {
        return false;
    }
    // Climbing further up than the root itself leaves it, whatever follows
    if (leading_ups(candidate.parts) > leading_ups(boundary.parts)) {
        return false;
    }
    return std::ranges::starts_with(candidate.parts, boundary.parts);
}

bool path_ends_with(const fs::path& path, const fs::path& suffix)
{
    const std::vector<fs::path> whole(path.begin(), path.end());
    const std::vector<fs::path> tail(suffix.begin(), suffix.end());
    if (tail.empty()) {
        return false;
    }
    return std::ranges::ends_with(whole, tail);
}

}  // namespace keydir::common
