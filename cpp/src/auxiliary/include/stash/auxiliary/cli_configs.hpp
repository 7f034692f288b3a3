#pragma once

#include <expected>
#include <string>

#include <nlohmann/json.hpp>

#include "stash/auxiliary/path.hpp"


namespace stash {

    class CliConfigs {

    public:
        void fill_default();

        // Where a mutating command writes when no output path is given
        Path resolve_output_path(const Path& input_path) const;

        void import_json(const nlohmann::json& json_data);
        nlohmann::json export_json() const;

    public:
        // Write back to the input file, or next to it as `<stem>_stash.png`
        bool overwrite_input_;

        // `print` command
        int print_preview_bytes_;
        int json_indent_;

        // `identify-text` command
        int identify_text_min_length_;
    };


    using ExpCliConfigs = std::expected<CliConfigs, std::string>;

    // Missing file yields the defaults. Broken file is an error.
    ExpCliConfigs load_cli_configs(const Path& path);
    ExpCliConfigs load_cli_configs();

}  // namespace stash
