#include "quill/change.hpp"

#include "quill/format.hpp"
#include "quill/utils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

using namespace quill::literals;

namespace quill {

    namespace detail {

        // Beyond this many cells the middle section is replaced wholesale instead of running LCS
        static constexpr size_t max_lcs_cells = 4'000'000U;

        struct edit_op {
            diff_line_kind kind{diff_line_kind::context};
            size_t old_index{};
            size_t new_index{};
        };

        static std::vector<edit_op> edit_script(
                const std::vector<std::string_view>& a, const std::vector<std::string_view>& b) {
            size_t prefix = 0U;
            while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
                ++prefix;
            }
            size_t suffix = 0U;
            while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
                   a[a.size() - 1U - suffix] == b[b.size() - 1U - suffix]) {
                ++suffix;
            }

            std::vector<edit_op> ops{};
            ops.reserve(a.size() + b.size());
            for (size_t i = 0U; i < prefix; ++i) {
                ops.push_back({diff_line_kind::context, i, i});
            }

            auto n = a.size() - prefix - suffix;
            auto m = b.size() - prefix - suffix;

            if (n == 0U || m == 0U || n * m > max_lcs_cells) {
                for (size_t i = 0U; i < n; ++i) {
                    ops.push_back({diff_line_kind::deletion, prefix + i, prefix});
                }
                for (size_t j = 0U; j < m; ++j) {
                    ops.push_back({diff_line_kind::addition, prefix + n, prefix + j});
                }
            }
            else {
                // lcs[i][j] = LCS length of a[i..n) and b[j..m) (middle section only)
                std::vector<uint32_t> lcs((n + 1U) * (m + 1U), 0U);
                auto at = [m](size_t i, size_t j) { return (i * (m + 1U)) + j; };
                for (size_t i = n; i-- > 0U;) {
                    for (size_t j = m; j-- > 0U;) {
                        if (a[prefix + i] == b[prefix + j]) {
                            lcs[at(i, j)] = lcs[at(i + 1U, j + 1U)] + 1U;
                        }
                        else {
                            lcs[at(i, j)] = std::max(lcs[at(i + 1U, j)], lcs[at(i, j + 1U)]);
                        }
                    }
                }

                size_t i = 0U;
                size_t j = 0U;
                while (i < n && j < m) {
                    if (a[prefix + i] == b[prefix + j]) {
                        ops.push_back({diff_line_kind::context, prefix + i, prefix + j});
                        ++i;
                        ++j;
                    }
                    else if (lcs[at(i + 1U, j)] >= lcs[at(i, j + 1U)]) {
                        ops.push_back({diff_line_kind::deletion, prefix + i, prefix + j});
                        ++i;
                    }
                    else {
                        ops.push_back({diff_line_kind::addition, prefix + i, prefix + j});
                        ++j;
                    }
                }
                for (; i < n; ++i) {
                    ops.push_back({diff_line_kind::deletion, prefix + i, prefix + m});
                }
                for (; j < m; ++j) {
                    ops.push_back({diff_line_kind::addition, prefix + n, prefix + j});
                }
            }

            for (size_t k = 0U; k < suffix; ++k) {
                ops.push_back({diff_line_kind::context, a.size() - suffix + k, b.size() - suffix + k});
            }
            return ops;
        }

        struct parsed_hunk {
            size_t old_start{};
            std::vector<std::string_view> old_lines{};
            std::vector<std::string_view> new_lines{};
        };

        struct parsed_diff {
            std::vector<parsed_hunk> hunks{};
            bool old_missing_newline{false};
            bool new_missing_newline{false};
            // the last hunk ended early
            bool cut{false};
        };

        static std::optional<std::pair<size_t, size_t>> parse_range(std::string_view text) {
            auto comma = text.find(',');
            auto start = utils::parse_arithmetic<size_t>(text.substr(0U, comma));
            if (!start) {
                return std::nullopt;
            }
            if (comma == std::string_view::npos) {
                return std::pair{*start, size_t{1U}};
            }
            auto count = utils::parse_arithmetic<size_t>(text.substr(comma + 1U));
            if (!count) {
                return std::nullopt;
            }
            return std::pair{*start, *count};
        }

        // With `cut`, the diff ended early: an unfinished last hunk keeps the lines it has
        static std::optional<parsed_diff> parse_unified(std::string_view diff, bool cut = false) {
            parsed_diff out{};
            auto lines = utils::split_lines(diff);
            size_t i = 0U;
            while (i < lines.size()) {
                auto line = lines[i];
                if (!line.starts_with("@@"sv)) {
                    ++i;
                    continue;
                }

                // @@ -a[,b] +c[,d] @@ optional section text
                auto minus = line.find('-');
                auto plus = line.find('+');
                auto close = line.find("@@"sv, 2U);
                if (minus == std::string_view::npos || plus == std::string_view::npos ||
                    close == std::string_view::npos || !(minus < plus && plus < close)) {
                    return std::nullopt;
                }
                auto old_range = parse_range(utils::trim_view(line.substr(minus + 1U, plus - minus - 1U)));
                auto new_range = parse_range(utils::trim_view(line.substr(plus + 1U, close - plus - 1U)));
                if (!old_range || !new_range) {
                    return std::nullopt;
                }

                parsed_hunk hunk{};
                hunk.old_start = old_range->first;
                auto old_remaining = old_range->second;
                auto new_remaining = new_range->second;
                char last_kind = ' ';
                ++i;
                while (i < lines.size() && (old_remaining > 0U || new_remaining > 0U || lines[i].starts_with('\\'))) {
                    auto body = lines[i];
                    if (body.ends_with('\r')) {
                        body.remove_suffix(1U);
                    }
                    auto kind = body.empty() ? ' ' : body.front();
                    auto text = body.empty() ? body : body.substr(1U);
                    switch (kind) {
                        case ' ':
                            if (old_remaining == 0U || new_remaining == 0U) {
                                return std::nullopt;
                            }
                            hunk.old_lines.push_back(text);
                            hunk.new_lines.push_back(text);
                            --old_remaining;
                            --new_remaining;
                            break;
                        case '-':
                            if (old_remaining == 0U) {
                                return std::nullopt;
                            }
                            hunk.old_lines.push_back(text);
                            --old_remaining;
                            break;
                        case '+':
                            if (new_remaining == 0U) {
                                return std::nullopt;
                            }
                            hunk.new_lines.push_back(text);
                            --new_remaining;
                            break;
                        case '\\':
                            if (last_kind == '-') {
                                out.old_missing_newline = true;
                            }
                            else if (last_kind == '+') {
                                out.new_missing_newline = true;
                            }
                            else {
                                out.old_missing_newline = true;
                                out.new_missing_newline = true;
                            }
                            break;
                        default:
                            return std::nullopt;
                    }
                    if (kind != '\\') {
                        last_kind = kind;
                    }
                    ++i;
                }
                if (old_remaining > 0U || new_remaining > 0U) {
                    if (!cut || i < lines.size()) {
                        return std::nullopt;
                    }
                    if (!hunk.old_lines.empty() || !hunk.new_lines.empty()) {
                        out.hunks.push_back(std::move(hunk));
                        out.cut = true;
                    }
                    break;
                }
                out.hunks.push_back(std::move(hunk));
            }
            if (out.hunks.empty()) {
                return std::nullopt;
            }
            return out;
        }

        static bool block_matches(
                const std::vector<std::string_view>& lines, size_t pos, const std::vector<std::string_view>& block) {
            if (pos + block.size() > lines.size()) {
                return false;
            }
            for (size_t k = 0U; k < block.size(); ++k) {
                auto line = lines[pos + k];
                if (line.ends_with('\r')) {
                    line.remove_suffix(1U);
                }
                if (line != block[k]) {
                    return false;
                }
            }
            return true;
        }

        // Nearest offset from `expected` (not before `floor`) where `block` matches
        static std::optional<size_t> locate_block(
                const std::vector<std::string_view>& lines,
                size_t floor,
                size_t expected,
                const std::vector<std::string_view>& block) {
            expected = std::clamp(expected, floor, lines.size());
            for (size_t delta = 0U; delta <= lines.size(); ++delta) {
                auto forward = expected + delta;
                if (forward <= lines.size() && block_matches(lines, forward, block)) {
                    return forward;
                }
                if (delta <= expected && expected - delta >= floor && delta > 0U &&
                    block_matches(lines, expected - delta, block)) {
                    return expected - delta;
                }
                if (forward > lines.size() && (delta > expected || expected - delta < floor)) {
                    break;
                }
            }
            return std::nullopt;
        }

        static std::optional<std::string> apply_parsed(std::string_view original, const parsed_diff& parsed) {
            auto lines = utils::split_lines(original);
            std::vector<std::string_view> result{};
            result.reserve(lines.size());

            size_t cursor = 0U;
            for (const auto& hunk : parsed.hunks) {
                // an empty old side means "insert after line old_start"
                auto expected = hunk.old_lines.empty() ? hunk.old_start
                                                       : (hunk.old_start > 0U ? hunk.old_start - 1U : 0U);
                auto pos = locate_block(lines, cursor, expected, hunk.old_lines);
                if (!pos) {
                    return std::nullopt;
                }
                result.insert(result.end(), lines.begin() + static_cast<std::ptrdiff_t>(cursor),
                              lines.begin() + static_cast<std::ptrdiff_t>(*pos));
                result.insert(result.end(), hunk.new_lines.begin(), hunk.new_lines.end());
                cursor = *pos + hunk.old_lines.size();
            }
            result.insert(result.end(), lines.begin() + static_cast<std::ptrdiff_t>(cursor), lines.end());

            bool trailing_newline = true;
            if (parsed.new_missing_newline) {
                trailing_newline = false;
            }
            else if (!parsed.old_missing_newline && !original.empty()) {
                trailing_newline = original.ends_with('\n');
            }

            std::string out{};
            for (size_t k = 0U; k < result.size(); ++k) {
                out += result[k];
                if (k + 1U < result.size() || trailing_newline) {
                    out.push_back('\n');
                }
            }
            return out;
        }

    }  // namespace detail

    bool try_parse_change_status(std::string_view text, change_status& out) {
        static constexpr std::array all{
                change_status::pending,
                change_status::accepted,
                change_status::rejected,
                change_status::modified,
                change_status::applied,
                change_status::reverted};
        for (auto status : all) {
            if (utils::str_case_eq(text, to_string(status))) {
                out = status;
                return true;
            }
        }
        return false;
    }

    std::vector<diff_hunk> generate_diff(std::string_view original, std::string_view modified, size_t context) {
        auto a = utils::split_lines(original);
        auto b = utils::split_lines(modified);
        auto ops = detail::edit_script(a, b);

        std::vector<size_t> changed{};
        for (size_t k = 0U; k < ops.size(); ++k) {
            if (ops[k].kind != diff_line_kind::context) {
                changed.push_back(k);
            }
        }

        std::vector<diff_hunk> hunks{};
        size_t c = 0U;
        while (c < changed.size()) {
            auto first = changed[c];
            auto last = first;
            while (c + 1U < changed.size() && changed[c + 1U] - last <= (2U * context) + 1U) {
                ++c;
                last = changed[c];
            }
            ++c;

            auto begin = first > context ? first - context : 0U;
            auto end = std::min(ops.size(), last + context + 1U);

            diff_hunk hunk{};
            size_t old_before = ops[begin].old_index;
            size_t new_before = ops[begin].new_index;
            for (auto k = begin; k < end; ++k) {
                const auto& op = ops[k];
                diff_line line{};
                line.kind = op.kind;
                switch (op.kind) {
                    case diff_line_kind::context:
                        line.text = std::string{a[op.old_index]};
                        line.old_line = op.old_index + 1U;
                        line.new_line = op.new_index + 1U;
                        ++hunk.old_count;
                        ++hunk.new_count;
                        break;
                    case diff_line_kind::deletion:
                        line.text = std::string{a[op.old_index]};
                        line.old_line = op.old_index + 1U;
                        ++hunk.old_count;
                        break;
                    case diff_line_kind::addition:
                        line.text = std::string{b[op.new_index]};
                        line.new_line = op.new_index + 1U;
                        ++hunk.new_count;
                        break;
                }
                hunk.lines.push_back(std::move(line));
            }
            hunk.old_start = hunk.old_count > 0U ? old_before + 1U : old_before;
            hunk.new_start = hunk.new_count > 0U ? new_before + 1U : new_before;
            hunks.push_back(std::move(hunk));
        }
        return hunks;
    }

    std::string format_unified_diff(std::string_view path, const std::vector<diff_hunk>& hunks) {
        std::string out{};
        out += "--- a/{}\n+++ b/{}\n"_format(path, path);
        for (const auto& hunk : hunks) {
            out += "@@ -{},{} +{},{} @@\n"_format(hunk.old_start, hunk.old_count, hunk.new_start, hunk.new_count);
            for (const auto& line : hunk.lines) {
                switch (line.kind) {
                    case diff_line_kind::context:
                        out.push_back(' ');
                        break;
                    case diff_line_kind::addition:
                        out.push_back('+');
                        break;
                    case diff_line_kind::deletion:
                        out.push_back('-');
                        break;
                }
                out += line.text;
                out.push_back('\n');
            }
        }
        return out;
    }

    std::optional<std::string> apply_unified_diff(std::string_view original, std::string_view diff) {
        auto parsed = detail::parse_unified(diff);
        if (!parsed) {
            return std::nullopt;
        }
        return detail::apply_parsed(original, *parsed);
    }

    std::optional<std::string> apply_truncated_unified_diff(std::string_view original, std::string_view diff) {
        std::vector<std::string_view> candidates{diff};
        // the last line may itself have been cut short
        auto body = diff;
        if (body.ends_with('\n')) {
            body.remove_suffix(1U);
        }
        if (auto nl = body.rfind('\n'); nl != std::string_view::npos) {
            candidates.push_back(body.substr(0U, nl + 1U));
        }

        for (auto text : candidates) {
            auto parsed = detail::parse_unified(text, true);
            if (!parsed) {
                continue;
            }
            if (auto patched = detail::apply_parsed(original, *parsed)) {
                return patched;
            }
            if (parsed->cut && parsed->hunks.size() > 1U) {
                parsed->hunks.pop_back();
                if (auto patched = detail::apply_parsed(original, *parsed)) {
                    return patched;
                }
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> unified_diff_target(std::string_view diff) {
        for (auto line : utils::split_lines(diff)) {
            if (!line.starts_with("+++ "sv)) {
                continue;
            }
            auto target = utils::trim_view(line.substr(4U));
            // strip a trailing timestamp ("path\t2024-01-01 ...")
            if (auto tab = target.find('\t'); tab != std::string_view::npos) {
                target = target.substr(0U, tab);
            }
            if (target == "/dev/null"sv) {
                return std::nullopt;
            }
            if (target.starts_with("b/"sv)) {
                target.remove_prefix(2U);
            }
            if (target.empty()) {
                return std::nullopt;
            }
            return std::string{target};
        }
        return std::nullopt;
    }

    line_anchor compute_anchor(std::string_view original, std::string_view modified) {
        auto hunks = generate_diff(original, modified, 0U);
        if (hunks.empty()) {
            return {};
        }
        auto start_of = [](const diff_hunk& hunk) { return std::max<size_t>(hunk.old_start, 1U); };
        auto end_of = [](const diff_hunk& hunk) {
            if (hunk.old_count == 0U) {
                return std::max<size_t>(hunk.old_start, 1U);
            }
            return hunk.old_start + hunk.old_count - 1U;
        };
        return {start_of(hunks.front()), end_of(hunks.back())};
    }

}  // namespace quill
