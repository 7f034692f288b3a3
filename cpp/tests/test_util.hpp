#pragma once

#include <cstdint>
#include <cstdio>
#include <format>
#include <print>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "stash/auxiliary/filesys.hpp"
#include "stash/auxiliary/path.hpp"


namespace stash::test {

    inline void require(
        const bool condition,
        const std::string_view message,
        const std::source_location loc = std::source_location::current()
    ) {
        if (!condition) {
            throw std::runtime_error(
                std::format("{}:{}: {}", loc.file_name(), loc.line(), message)
            );
        }
    }

    inline void log(const std::string_view message) {
        std::println("[pngstash-test] {}", message);
    }

    // Runs `fn` and reports whether it threw
    template <typename TFunc>
    int run_test(const std::string_view name, TFunc&& fn) {
        try {
            log(std::format("{}: start", name));
            fn();
            log(std::format("{}: finished", name));
            return 0;
        } catch (const std::exception& e) {
            std::println(stderr, "[pngstash-test] FAILED: {}", e.what());
            return 1;
        }
    }

    inline std::vector<uint8_t> to_bytes(const std::string_view text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    // repo/fixtures/images, found from this header's own location
    inline Path fixture_dir(
        const std::source_location loc = std::source_location::current()
    ) {
        const auto source_path = stash::fromstr(loc.file_name());
        return source_path.parent_path().parent_path().parent_path() /
               "fixtures" / "images";
    }

    // 1x1 grayscale PNG with chunks IHDR, tEXt("Comment", "hello"), IDAT, IEND
    inline std::vector<uint8_t> load_tiny_png() {
        const auto path = fixture_dir() / "tiny_gray.png";
        std::vector<uint8_t> bytes;
        if (!stash::read_file(path, bytes))
            throw std::runtime_error("Missing fixture: " + stash::tostr(path));
        return bytes;
    }

    // Fresh directory under the system temp dir, removed on destruction
    class TempDir {

    public:
        explicit TempDir(const std::string& name)
            : path_(fs::temp_directory_path() / ("pngstash_" + name)) {
            fs::remove_all(path_);
            fs::create_directories(path_);
        }

        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const Path& path() const { return path_; }

    private:
        Path path_;
    };

}  // namespace stash::test
