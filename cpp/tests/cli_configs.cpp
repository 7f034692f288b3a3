#include <fstream>

#include "stash/auxiliary/cli_configs.hpp"

#include "test_util.hpp"


namespace {

    using stash::test::require;


    void write_text(const stash::Path& path, const std::string& text) {
        std::ofstream ofs(path);
        ofs << text;
        require(static_cast<bool>(ofs), "write " + stash::tostr(path));
    }


    void test_defaults() {
        stash::CliConfigs configs;
        configs.fill_default();

        require(configs.overwrite_input_, "overwrite by default");
        require(configs.print_preview_bytes_ == 16, "preview bytes");
        require(configs.json_indent_ == 2, "json indent");
        require(configs.identify_text_min_length_ == 1, "min text length");

        // Empty object keeps every default
        stash::CliConfigs imported;
        imported.import_json(nlohmann::json::object());
        require(
            imported.export_json() == configs.export_json(),
            "empty object yields defaults"
        );
    }

    void test_export_import() {
        stash::CliConfigs configs;
        configs.fill_default();
        configs.overwrite_input_ = false;
        configs.print_preview_bytes_ = 4;
        configs.identify_text_min_length_ = 8;

        const auto json_data = configs.export_json();
        require(json_data.at("overwrite_input") == false, "exported flag");
        require(json_data.at("print_preview_bytes") == 4, "exported bytes");

        stash::CliConfigs other;
        other.import_json(json_data);
        require(!other.overwrite_input_, "imported flag");
        require(other.print_preview_bytes_ == 4, "imported bytes");
        require(other.json_indent_ == 2, "imported indent");
        require(other.identify_text_min_length_ == 8, "imported min length");
    }

    void test_resolve_output_path() {
        stash::CliConfigs configs;
        configs.fill_default();

        const auto input = stash::fromstr("images/cat.png");
        require(configs.resolve_output_path(input) == input, "overwrite");

        configs.overwrite_input_ = false;
        require(
            configs.resolve_output_path(input) ==
                stash::fromstr("images/cat_stash.png"),
            "sibling output"
        );
    }

    void test_load_from_file() {
        stash::test::TempDir dir{ "cli_configs" };

        // Missing file
        {
            const auto configs = stash::load_cli_configs(dir.path() / "nope.json");
            require(configs.has_value(), "missing file yields defaults");
            require(configs->print_preview_bytes_ == 16, "default bytes");
            require(
                !stash::fs::exists(dir.path() / "nope.json"),
                "nothing written for a missing file"
            );
        }

        // Partial file
        {
            const auto path = dir.path() / "partial.json";
            ::write_text(path, R"({ "json_indent": 0, "overwrite_input": false })");
            const auto configs = stash::load_cli_configs(path);
            require(configs.has_value(), "partial file must load");
            require(configs->json_indent_ == 0, "indent from file");
            require(!configs->overwrite_input_, "flag from file");
            require(configs->print_preview_bytes_ == 16, "default kept");
        }

        // Malformed JSON
        {
            const auto path = dir.path() / "broken.json";
            ::write_text(path, "{ \"json_indent\": ");
            const auto configs = stash::load_cli_configs(path);
            require(!configs.has_value(), "broken json must fail");
            require(
                configs.error().find("broken.json") != std::string::npos,
                "error names the file: " + configs.error()
            );
        }

        // Wrong type
        {
            const auto path = dir.path() / "typed.json";
            ::write_text(path, R"({ "print_preview_bytes": "many" })");
            const auto configs = stash::load_cli_configs(path);
            require(!configs.has_value(), "wrong type must fail");
            require(
                configs.error().find("print_preview_bytes") != std::string::npos,
                "error names the key: " + configs.error()
            );
        }

        // Negative value
        {
            const auto path = dir.path() / "negative.json";
            ::write_text(path, R"({ "identify_text_min_length": -3 })");
            require(
                !stash::load_cli_configs(path).has_value(),
                "negative value must fail"
            );
        }

        // Root must be an object
        {
            const auto path = dir.path() / "array.json";
            ::write_text(path, "[1, 2, 3]");
            require(
                !stash::load_cli_configs(path).has_value(),
                "array root must fail"
            );
        }
    }

}  // namespace


int main() {
    return stash::test::run_test("cli_configs", [] {
        ::test_defaults();
        ::test_export_import();
        ::test_resolve_output_path();
        ::test_load_from_file();
    });
}
