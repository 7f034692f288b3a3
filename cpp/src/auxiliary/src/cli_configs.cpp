#include "stash/auxiliary/cli_configs.hpp"

#include <fstream>
#include <stdexcept>


namespace {

    constexpr bool DEFAULT_OVERWRITE_INPUT = true;
    constexpr int DEFAULT_PREVIEW_BYTES = 16;
    constexpr int DEFAULT_JSON_INDENT = 2;
    constexpr int DEFAULT_TEXT_MIN_LEN = 1;

    const char* const DEFAULT_CONFIG_PATH = "./pngstash_configs.json";


    template <typename T>
    T try_get(
        const nlohmann::json& j, const char* key, const T& default_value
    ) {
        if (!j.contains(key))
            return default_value;

        try {
            return j.at(key).get<T>();
        } catch (const nlohmann::json::exception&) {
            throw std::runtime_error(
                "Invalid type for key '" + std::string(key) + "'"
            );
        }
    }

    int try_get_non_negative(
        const nlohmann::json& j, const char* key, const int default_value
    ) {
        const auto value = ::try_get(j, key, default_value);
        if (value < 0) {
            throw std::runtime_error(
                "Value for key '" + std::string(key) + "' must not be negative"
            );
        }
        return value;
    }

}  // namespace


// CliConfigs
namespace stash {

    void CliConfigs::fill_default() {
        overwrite_input_ = DEFAULT_OVERWRITE_INPUT;
        print_preview_bytes_ = DEFAULT_PREVIEW_BYTES;
        json_indent_ = DEFAULT_JSON_INDENT;
        identify_text_min_length_ = DEFAULT_TEXT_MIN_LEN;
    }

    Path CliConfigs::resolve_output_path(const Path& input_path) const {
        if (overwrite_input_)
            return input_path;

        return stash::path_concat(stash::remove_ext(input_path), "_stash.png");
    }

    void CliConfigs::import_json(const nlohmann::json& json_data) {
        if (!json_data.is_object())
            throw std::runtime_error("Config root must be a JSON object");

        overwrite_input_ = try_get(
            json_data, "overwrite_input", DEFAULT_OVERWRITE_INPUT
        );
        print_preview_bytes_ = try_get_non_negative(
            json_data, "print_preview_bytes", DEFAULT_PREVIEW_BYTES
        );
        json_indent_ = try_get_non_negative(
            json_data, "json_indent", DEFAULT_JSON_INDENT
        );
        identify_text_min_length_ = try_get_non_negative(
            json_data, "identify_text_min_length", DEFAULT_TEXT_MIN_LEN
        );
    }

    nlohmann::json CliConfigs::export_json() const {
        auto output = nlohmann::json::object();

        output["overwrite_input"] = overwrite_input_;
        output["print_preview_bytes"] = print_preview_bytes_;
        output["json_indent"] = json_indent_;
        output["identify_text_min_length"] = identify_text_min_length_;

        return output;
    }

}  // namespace stash


// Free functions
namespace stash {

    ExpCliConfigs load_cli_configs(const Path& path) {
        CliConfigs configs;
        configs.fill_default();

        std::ifstream ifs(path);
        if (!ifs)
            return configs;

        nlohmann::json json_data;
        try {
            ifs >> json_data;
        } catch (const std::exception& e) {
            return std::unexpected(
                "Failed to parse " + stash::tostr(path) + ": " + e.what()
            );
        }

        try {
            configs.import_json(json_data);
        } catch (const std::exception& e) {
            return std::unexpected(
                "Invalid config " + stash::tostr(path) + ": " + e.what()
            );
        }

        return configs;
    }

    ExpCliConfigs load_cli_configs() {
        return load_cli_configs(stash::fromstr(DEFAULT_CONFIG_PATH));
    }

}  // namespace stash
