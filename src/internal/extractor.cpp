#include "extractor.hpp"

#include "quill/change.hpp"
#include "quill/utils.hpp"

namespace quill::internal {

    namespace detail {

        struct fence_info {
            size_t length{};
            char ch{'`'};
            std::string_view info{};
        };

        static std::optional<fence_info> parse_fence(std::string_view line) {
            auto first = line.find_first_not_of(" \t");
            if (first == std::string_view::npos || first > 3U) {
                return std::nullopt;
            }
            line.remove_prefix(first);
            auto ch = line.front();
            if (ch != '`' && ch != '~') {
                return std::nullopt;
            }
            auto length = line.find_first_not_of(ch);
            if (length == std::string_view::npos) {
                length = line.size();
            }
            if (length < 3U) {
                return std::nullopt;
            }
            return fence_info{length, ch, utils::trim_view(line.substr(length))};
        }

        static std::vector<std::string_view> split_words(std::string_view text) {
            std::vector<std::string_view> words{};
            size_t pos = 0U;
            while (pos < text.size()) {
                auto start = text.find_first_not_of(" \t", pos);
                if (start == std::string_view::npos) {
                    break;
                }
                auto end = text.find_first_of(" \t", start);
                if (end == std::string_view::npos) {
                    end = text.size();
                }
                words.push_back(text.substr(start, end - start));
                pos = end;
            }
            return words;
        }

        static bool looks_like_path(std::string_view token) {
            return token.find('/') != std::string_view::npos || token.find('.') != std::string_view::npos;
        }

        static void describe_block(std::string_view info, extracted_block& block) {
            auto words = split_words(info);
            if (words.empty()) {
                return;
            }
            for (auto word : words) {
                for (auto key : {"path="sv, "file="sv}) {
                    if (word.starts_with(key)) {
                        block.path = std::string{word.substr(key.size())};
                    }
                }
            }

            auto head = words.front();
            if (auto colon = head.find(':'); colon != std::string_view::npos && block.path.empty()) {
                block.language = std::string{head.substr(0, colon)};
                block.path = std::string{head.substr(colon + 1U)};
            }
            else if (!head.contains('=')) {
                if (words.size() == 1U && looks_like_path(head)) {
                    block.path = std::string{head};
                }
                else {
                    block.language = std::string{head};
                    if (block.path.empty() && words.size() >= 2U && !words[1].contains('=') &&
                        looks_like_path(words[1])) {
                        block.path = std::string{words[1]};
                    }
                }
            }

            auto language = utils::to_lower(block.language);
            block.is_diff = language == "diff"sv || language == "patch"sv;
        }

    }  // namespace detail

    std::vector<extracted_block> block_extractor::feed(std::string_view text) {
        std::vector<extracted_block> completed{};
        partial_.append(text);

        size_t start = 0U;
        for (auto nl = partial_.find('\n'); nl != std::string::npos; nl = partial_.find('\n', start)) {
            std::string_view line{partial_.data() + start, nl - start};
            if (line.ends_with('\r')) {
                line.remove_suffix(1U);
            }
            if (auto block = consume_line(line)) {
                completed.push_back(std::move(*block));
            }
            start = nl + 1U;
        }
        partial_.erase(0, start);
        return completed;
    }

    std::optional<extracted_block> block_extractor::finish() {
        std::optional<extracted_block> result{};
        if (!partial_.empty()) {
            auto line = std::move(partial_);
            partial_.clear();
            result = consume_line(line);
        }
        if (in_block_) {
            result = close_block(true);
        }
        return result;
    }

    std::optional<extracted_block> block_extractor::consume_line(std::string_view line) {
        auto fence = detail::parse_fence(line);
        if (!in_block_) {
            if (!fence) {
                return std::nullopt;
            }
            in_block_ = true;
            fence_len_ = fence->length;
            fence_char_ = fence->ch;
            current_ = extracted_block{};
            detail::describe_block(fence->info, current_);
            return std::nullopt;
        }

        if (fence && fence->ch == fence_char_ && fence->length >= fence_len_ && fence->info.empty()) {
            return close_block(false);
        }
        current_.content.append(line);
        current_.content.push_back('\n');
        return std::nullopt;
    }

    std::optional<extracted_block> block_extractor::close_block(bool truncated) {
        in_block_ = false;
        auto block = std::move(current_);
        current_ = extracted_block{};
        block.truncated = truncated;

        if (block.is_diff && block.path.empty()) {
            if (auto target = unified_diff_target(block.content)) {
                block.path = std::move(*target);
            }
        }
        if (block.path.empty()) {
            debug_log("skipping fenced block without a target file (language '", block.language, "')");
            return std::nullopt;
        }
        return block;
    }

}  // namespace quill::internal
