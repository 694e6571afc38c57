/**
 * pawkit CLI - config command
 *
 * Read and write values in config.json.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pawkit::cli::commands {

namespace {

struct ConfigOptions {
    std::string key;
    std::string value;
};

int cmd_config_get(const GlobalOptions& opts, const ConfigOptions& config_opts) {
    auto config = open_config(opts);

    auto result = config_opts.key.empty() ? config.get_all() : config.get(config_opts.key);
    if (!result.ok) {
        print_error(result.error);
        return 1;
    }

    if (config_opts.key.empty() || opts.json) {
        output_json(result.value);
    } else {
        std::cout << config_opts.key << " = "
                  << (result.value.is_string() ? result.value.get<std::string>()
                                               : result.value.dump())
                  << std::endl;
    }
    return 0;
}

int cmd_config_set(const GlobalOptions& opts, const ConfigOptions& config_opts) {
    auto paths = get_pawkit_paths(resolve_root(opts));

    std::string error;
    if (!ensure_pawkit_structure(paths, error)) {
        print_error(error);
        return 1;
    }

    ConfigStore config(paths.config_file);
    auto stored = config.set(config_opts.key, config_opts.value);
    if (!stored.ok) {
        print_error(stored.error);
        return 1;
    }

    print_success(config_opts.key + " = " + config_opts.value);
    return 0;
}

} // namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    static ConfigOptions get_opts;
    static ConfigOptions set_opts;

    app->require_subcommand(1);

    auto* get_cmd = app->add_subcommand("get", "Show one value, or every value");
    get_cmd->add_option("key", get_opts.key, "Configuration key");
    get_cmd->callback([&opts]() {
        std::exit(cmd_config_get(opts, get_opts));
    });

    auto* set_cmd = app->add_subcommand("set", "Store a value (\"true\"/\"false\" become booleans)");
    set_cmd->add_option("key", set_opts.key, "Configuration key")->required();
    set_cmd->add_option("value", set_opts.value, "Value")->required();
    set_cmd->callback([&opts]() {
        std::exit(cmd_config_set(opts, set_opts));
    });
}

} // namespace pawkit::cli::commands
