#include "quill/workspace.hpp"

#include "quill/format.hpp"
#include "quill/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <system_error>

using namespace quill::literals;

namespace quill {

    namespace fs = std::filesystem;

    namespace detail {

        struct language_entry {
            std::string_view extension;
            std::string_view language;
        };

        static constexpr std::array<language_entry, 38> language_table{{
                {".c"sv, "c"sv},
                {".h"sv, "c"sv},
                {".cc"sv, "cpp"sv},
                {".cpp"sv, "cpp"sv},
                {".cxx"sv, "cpp"sv},
                {".hh"sv, "cpp"sv},
                {".hpp"sv, "cpp"sv},
                {".hxx"sv, "cpp"sv},
                {".rs"sv, "rust"sv},
                {".go"sv, "go"sv},
                {".py"sv, "python"sv},
                {".js"sv, "javascript"sv},
                {".jsx"sv, "javascript"sv},
                {".mjs"sv, "javascript"sv},
                {".ts"sv, "typescript"sv},
                {".tsx"sv, "typescript"sv},
                {".java"sv, "java"sv},
                {".kt"sv, "kotlin"sv},
                {".swift"sv, "swift"sv},
                {".rb"sv, "ruby"sv},
                {".php"sv, "php"sv},
                {".cs"sv, "csharp"sv},
                {".sh"sv, "shell"sv},
                {".bash"sv, "shell"sv},
                {".zsh"sv, "shell"sv},
                {".json"sv, "json"sv},
                {".yaml"sv, "yaml"sv},
                {".yml"sv, "yaml"sv},
                {".toml"sv, "toml"sv},
                {".xml"sv, "xml"sv},
                {".html"sv, "html"sv},
                {".css"sv, "css"sv},
                {".scss"sv, "scss"sv},
                {".md"sv, "markdown"sv},
                {".sql"sv, "sql"sv},
                {".cmake"sv, "cmake"sv},
                {".lua"sv, "lua"sv},
                {".diff"sv, "diff"sv},
        }};

        static constexpr std::array<std::string_view, 5> ignored_directories{
                "node_modules"sv, "target"sv, "dist"sv, "build"sv, "__pycache__"sv};

        static std::atomic<uint64_t> temp_counter{0U};

        static void write_all_fd(int fd, std::string_view bytes, const fs::path& path) {
            size_t offset = 0U;
            while (offset < bytes.size()) {
                auto n = ::write(fd, bytes.data() + offset, bytes.size() - offset);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    throw std::system_error(errno, std::generic_category(), "write " + path.string());
                }
                offset += static_cast<size_t>(n);
            }
        }

        static bool node_less(const file_node& lhs, const file_node& rhs) {
            if (lhs.is_directory != rhs.is_directory) {
                return lhs.is_directory;
            }
            auto l = utils::to_lower(lhs.name);
            auto r = utils::to_lower(rhs.name);
            if (l != r) {
                return l < r;
            }
            return lhs.name < rhs.name;
        }

        static void fill_tree(file_node& node, const fs::path& dir, size_t depth_left) {
            std::error_code ec{};
            for (const auto& entry : fs::directory_iterator(dir, ec)) {
                auto name = entry.path().filename().string();
                if (workspace::is_ignored(name)) {
                    continue;
                }
                std::error_code type_ec{};
                file_node child{};
                child.name = name;
                child.path = node.path.empty() ? name : node.path + "/" + name;
                child.is_directory = entry.is_directory(type_ec);
                if (child.is_directory && depth_left > 0U) {
                    fill_tree(child, entry.path(), depth_left - 1U);
                }
                node.children.push_back(std::move(child));
            }
            if (ec) {
                debug_log("directory listing failed for ", dir.string(), ": ", ec.message());
            }
            std::ranges::sort(node.children, node_less);
        }

        // Distance in segments from the segment holding the match to the file name; nullopt if no match
        static std::optional<size_t> segment_proximity(std::string_view path, std::string_view needle) {
            auto lowered = utils::to_lower(path);
            auto pos = lowered.rfind(needle);
            if (pos == std::string::npos) {
                return std::nullopt;
            }
            auto match_end = pos + needle.size();
            auto tail = std::string_view{lowered}.substr(match_end);
            return static_cast<size_t>(std::ranges::count(tail, '/'));
        }

        static bool looks_binary(std::string_view bytes) {
            auto head = bytes.substr(0U, std::min<size_t>(bytes.size(), 8000U));
            return head.find('\0') != std::string_view::npos;
        }

    }  // namespace detail

    std::string_view detect_language(const fs::path& path) {
        auto filename = path.filename().string();
        if (filename == "CMakeLists.txt"sv) {
            return "cmake"sv;
        }
        if (filename == "Makefile"sv) {
            return "make"sv;
        }
        if (filename == "Dockerfile"sv) {
            return "dockerfile"sv;
        }
        auto extension = utils::to_lower(path.extension().string());
        for (const auto& entry : detail::language_table) {
            if (entry.extension == extension) {
                return entry.language;
            }
        }
        return "text"sv;
    }

    std::string read_file_bytes(const fs::path& path) {
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            throw std::system_error(errno, std::generic_category(), "open " + path.string());
        }

        std::string bytes{};
        struct stat st{};
        if (::fstat(fd, &st) == 0 && st.st_size > 0) {
            bytes.reserve(static_cast<size_t>(st.st_size));
        }

        char chunk[8192]{};
        for (;;) {
            auto n = ::read(fd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                auto saved = errno;
                ::close(fd);
                throw std::system_error(saved, std::generic_category(), "read " + path.string());
            }
            if (n == 0) {
                break;
            }
            bytes.append(chunk, static_cast<size_t>(n));
        }
        ::close(fd);
        return bytes;
    }

    fs::path write_sibling_temp(const fs::path& path, std::string_view bytes) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        auto temp = parent / ".{}.quill-{}-{}"_format(
                                     path.filename().string(), static_cast<long>(::getpid()), ++detail::temp_counter);

        int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw std::system_error(errno, std::generic_category(), "create " + temp.string());
        }

        try {
            struct stat st{};
            if (::stat(path.c_str(), &st) == 0) {
                (void)::fchmod(fd, st.st_mode & 07777);
            }
            detail::write_all_fd(fd, bytes, temp);
            if (::fsync(fd) != 0) {
                throw std::system_error(errno, std::generic_category(), "fsync " + temp.string());
            }
        } catch (...) {
            ::close(fd);
            std::error_code ec{};
            fs::remove(temp, ec);
            throw;
        }

        if (::close(fd) != 0) {
            auto saved = errno;
            std::error_code ec{};
            fs::remove(temp, ec);
            throw std::system_error(saved, std::generic_category(), "close " + temp.string());
        }
        return temp;
    }

    void write_file_atomic(const fs::path& path, std::string_view bytes) {
        auto temp = write_sibling_temp(path, bytes);
        std::error_code ec{};
        fs::rename(temp, path, ec);
        if (ec) {
            std::error_code ignored{};
            fs::remove(temp, ignored);
            throw std::system_error(ec, "rename " + path.string());
        }
    }

    workspace::workspace(fs::path root) {
        std::error_code ec{};
        auto absolute = fs::absolute(root, ec);
        root_ = ec ? root.lexically_normal() : fs::weakly_canonical(absolute, ec);
        if (ec) {
            root_ = absolute.lexically_normal();
        }
    }

    bool workspace::is_ignored(std::string_view name) {
        if (name.empty() || name.front() == '.') {
            return true;
        }
        return std::ranges::find(detail::ignored_directories, name) != detail::ignored_directories.end();
    }

    std::optional<std::string> workspace::normalize(std::string_view relative) const {
        auto raw = fs::path{std::string{relative}};
        if (raw.is_absolute()) {
            return std::nullopt;
        }
        auto rel = raw.lexically_normal();
        auto text = rel.generic_string();
        while (text.ends_with('/')) {
            text.pop_back();
        }
        if (text == "."sv) {
            text.clear();
        }
        if (text == ".."sv || text.starts_with("../"sv)) {
            return std::nullopt;
        }

        // symlinks must not lead out of the root either
        std::error_code ec{};
        auto canonical = fs::weakly_canonical(root_ / rel, ec);
        if (!ec && !text.empty()) {
            auto inside = canonical.lexically_relative(root_).generic_string();
            if (inside.empty() || inside == ".."sv || inside.starts_with("../"sv)) {
                return std::nullopt;
            }
        }
        return text;
    }

    std::optional<fs::path> workspace::resolve(std::string_view relative) const {
        auto rel = normalize(relative);
        if (!rel) {
            return std::nullopt;
        }
        if (rel->empty()) {
            return root_;
        }
        return root_ / *rel;
    }

    file_node workspace::file_tree(std::string_view directory, size_t max_depth) const {
        auto rel = normalize(directory);
        if (!rel) {
            throw context_build_error{
                    context_errc::permission_denied,
                    "path escapes the workspace: {}"_format(directory),
                    std::string{directory}};
        }
        auto dir = rel->empty() ? root_ : root_ / *rel;
        std::error_code ec{};
        if (!fs::is_directory(dir, ec)) {
            throw context_build_error{context_errc::not_found, "no such directory: {}"_format(*rel), *rel};
        }

        file_node node{};
        node.name = rel->empty() ? root_.filename().string() : fs::path{*rel}.filename().string();
        node.path = *rel;
        node.is_directory = true;
        detail::fill_tree(node, dir, max_depth);
        return node;
    }

    std::vector<std::string> workspace::list_files() const {
        std::vector<std::string> files{};
        std::error_code ec{};
        fs::recursive_directory_iterator it{root_, fs::directory_options::skip_permission_denied, ec};
        if (ec) {
            return files;
        }
        for (; it != fs::recursive_directory_iterator{}; it.increment(ec)) {
            if (ec) {
                debug_log("workspace walk stopped: ", ec.message());
                break;
            }
            auto name = it->path().filename().string();
            if (is_ignored(name)) {
                if (it->is_directory(ec)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (it->is_regular_file(ec)) {
                files.push_back(it->path().lexically_relative(root_).generic_string());
            }
        }
        std::ranges::sort(files);
        return files;
    }

    std::vector<std::string> workspace::search_files(std::string_view query, size_t limit) const {
        auto needle = utils::to_lower(utils::trim_view(query));
        if (needle.empty()) {
            return {};
        }

        struct ranked {
            std::string path{};
            size_t proximity{};
        };

        std::vector<ranked> matches{};
        for (auto& path : list_files()) {
            if (auto proximity = detail::segment_proximity(path, needle)) {
                matches.push_back({std::move(path), *proximity});
            }
        }

        std::ranges::sort(matches, [](const ranked& lhs, const ranked& rhs) {
            if (lhs.proximity != rhs.proximity) {
                return lhs.proximity < rhs.proximity;
            }
            if (lhs.path.size() != rhs.path.size()) {
                return lhs.path.size() < rhs.path.size();
            }
            return lhs.path < rhs.path;
        });

        std::vector<std::string> out{};
        for (auto& match : matches) {
            if (out.size() >= limit) {
                break;
            }
            out.push_back(std::move(match.path));
        }
        return out;
    }

    std::vector<content_match> workspace::search_content(std::string_view query, size_t limit) const {
        auto needle = utils::to_lower(query);
        std::vector<content_match> out{};
        if (needle.empty()) {
            return out;
        }

        for (const auto& path : list_files()) {
            std::string bytes{};
            try {
                bytes = read_file_bytes(root_ / path);
            } catch (const std::system_error& e) {
                debug_log("skipping unreadable file ", path, ": ", e.what());
                continue;
            }
            if (detail::looks_binary(bytes)) {
                continue;
            }

            auto lines = utils::split_lines(bytes);
            for (size_t i = 0U; i < lines.size(); ++i) {
                auto lowered = utils::to_lower(lines[i]);
                auto pos = lowered.find(needle);
                if (pos == std::string::npos) {
                    continue;
                }
                out.push_back(content_match{
                        .path = path,
                        .line = i + 1U,
                        .column_start = pos + 1U,
                        .column_end = pos + 1U + needle.size(),
                        .line_text = std::string{lines[i]}});
                if (out.size() >= limit) {
                    return out;
                }
            }
        }
        return out;
    }

    file_info workspace::get_file_info(std::string_view path) const {
        auto resolved = resolve(path);
        if (!resolved) {
            throw context_build_error{
                    context_errc::permission_denied, "path escapes the workspace: {}"_format(path), std::string{path}};
        }

        std::error_code ec{};
        auto status = fs::status(*resolved, ec);
        if (ec || !fs::exists(status)) {
            throw context_build_error{context_errc::not_found, "no such file: {}"_format(path), std::string{path}};
        }

        file_info info{};
        info.path = *normalize(path);
        info.is_directory = fs::is_directory(status);
        info.modified_at = fs::last_write_time(*resolved, ec);
        if (info.is_directory) {
            return info;
        }

        info.size = fs::file_size(*resolved, ec);
        info.language = std::string{detect_language(*resolved)};
        try {
            auto bytes = read_file_bytes(*resolved);
            info.line_count = utils::split_lines(bytes).size();
        } catch (const std::system_error& e) {
            throw context_build_error{
                    context_errc::permission_denied, "cannot read {}: {}"_format(path, e.what()), std::string{path}};
        }
        return info;
    }

}  // namespace quill
