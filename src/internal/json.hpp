#pragma once

#include "quill/format.hpp"
#include "quill/workspace.hpp"

#include <glaze/glaze.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace quill::internal {

    using namespace quill::literals;

    inline std::string read_text_file(const std::filesystem::path& path) {
        try {
            return read_file_bytes(path);
        } catch (const std::system_error& e) {
            throw std::runtime_error("failed to read {}: {}"_format(path.string(), e.code().message()));
        }
    }

    template <typename T>
    void write_json_file(const T& value, const std::filesystem::path& path) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw std::runtime_error("failed to serialize json for {}"_format(path.string()));
        }
        json.push_back('\n');

        try {
            write_file_atomic(path, json);
        } catch (const std::system_error& e) {
            throw std::runtime_error("failed to write {}: {}"_format(path.string(), e.code().message()));
        }
    }

    template <typename T>
    T read_json_file(const std::filesystem::path& path, bool allow_unknown_keys = false) {
        T value{};
        auto json = read_text_file(path);
        if (allow_unknown_keys) {
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
            if (ec) {
                throw std::runtime_error("failed to parse json file {}"_format(path.string()));
            }
        }
        else {
            auto ec = glz::read_json(value, json);
            if (ec) {
                throw std::runtime_error("failed to parse json file {}"_format(path.string()));
            }
        }
        return value;
    }

    inline void validate_supported_schema_version(int schema_version, const std::filesystem::path& path) {
        constexpr int supported_schema_version = 1;
        if (schema_version > supported_schema_version) {
            throw std::runtime_error(
                    "unsupported schema_version in {}: {} > {}"_format(
                            path.string(), schema_version, supported_schema_version));
        }
    }

}  // namespace quill::internal
