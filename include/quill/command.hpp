#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quill {

    using flag_value = std::variant<std::string, bool>;

    enum class flag_shape : uint8_t { boolean, value };

    struct flag_spec {
        std::string_view name{};
        flag_shape shape{flag_shape::boolean};
    };

    struct command_spec {
        std::string_view verb{};
        std::string_view alias{};
        std::string_view usage{};
        std::string_view summary{};
        bool requires_argument{false};
        std::span<const flag_spec> flags{};
    };

    // Registered verbs in declaration order; ranking ties break on this order
    std::span<const command_spec> command_registry();
    std::span<const flag_spec> global_flags();

    const command_spec* find_command(std::string_view verb);

    /*
     * Result of parsing one submission. `raw_input` is kept byte for byte; every other field
     * is derived from it and never mutated afterwards.
     *
     * - verb: lowercase registry name (aliases resolved); "ask" for free text; empty for blank input.
     * - argument: non-flag tokens of the input, mentions included verbatim.
     * - flags: `--name` (true) and `--name=value` tokens.
     * - mentioned_files: `@path` / `@"path with spaces"` tokens in input order, unresolved.
     * - malformed_flags: flag-like tokens that could not be read (reported by validate()).
     */
    struct parsed_command {
        std::string verb{};
        std::string argument{};
        std::map<std::string, flag_value, std::less<>> flags{};
        std::vector<std::string> mentioned_files{};
        std::vector<std::string> malformed_flags{};
        std::string raw_input{};

        bool has_flag(std::string_view name) const;
        std::optional<std::string> flag_string(std::string_view name) const;
    };

    parsed_command parse(std::string_view raw_input);

    struct validation_result {
        validation_status status{validation_status::ok};
        std::string detail{};

        bool ok() const noexcept { return status == validation_status::ok; }
    };

    validation_result validate(const parsed_command& command);

    enum class suggestion_kind : uint8_t { command, history };

    struct suggestion {
        std::string text{};
        suggestion_kind kind{suggestion_kind::command};
        int score{};
    };

    // Pure ranking over the registry and `recent_history` (newest last)
    std::vector<suggestion> suggestions(std::string_view partial, std::span<const std::string> recent_history = {});

    class command_history {
      public:
        static constexpr size_t default_capacity = 100U;

        explicit command_history(size_t capacity = default_capacity) : capacity_{capacity} {}

        void add(std::string_view input);
        std::vector<std::string> entries() const;
        std::vector<std::string> search(std::string_view query) const;
        size_t size() const noexcept { return entries_.size(); }

      private:
        size_t capacity_;
        std::deque<std::string> entries_{};
    };

    // Usage line and summary of every registered verb
    std::string command_reference();

    // Role preamble appended to the system prompt for `verb`
    std::string_view verb_preamble(std::string_view verb);

}  // namespace quill
