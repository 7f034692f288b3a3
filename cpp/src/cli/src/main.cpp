#include <cstdio>
#include <print>
#include <string>
#include <vector>

#include "args.hpp"
#include "commands.hpp"
#include "stash/auxiliary/cli_configs.hpp"


int main(int argc, char* argv[]) {
    const std::string program_name = argc > 0 ? argv[0] : "pngstash";
    std::vector<std::string> arg_list;
    for (int i = 1; i < argc; ++i)
        arg_list.emplace_back(argv[i]);

    const auto args = stash::parse_args(arg_list);
    if (!args) {
        std::println(stderr, "Error: {}\n", args.error());
        std::println(stderr, "{}", stash::usage_str(program_name));
        return 1;
    }

    const auto configs = args->config_path_
                             ? stash::load_cli_configs(*args->config_path_)
                             : stash::load_cli_configs();
    if (!configs) {
        std::println(stderr, "Cannot load configs: {}", configs.error());
        return 1;
    }

    const auto result = stash::execute_command(args->command_, *configs);
    if (!result) {
        std::println(stderr, "Error: {}", result.error());
        return 1;
    }

    return 0;
}
