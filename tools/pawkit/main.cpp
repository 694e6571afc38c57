/**
 * pawkit CLI - Entry Point
 *
 * Installs, removes and updates paw packages.
 */

#include <CLI/CLI.hpp>
#include <pawkit/version.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace pawkit::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts, bool force);
    void setup_uninstall(CLI::App* app, GlobalOptions& opts);
    void setup_info(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_addrepo(CLI::App* app, GlobalOptions& opts);
    void setup_removerepo(CLI::App* app, GlobalOptions& opts);
    void setup_update(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace pawkit::cli;

    CLI::App app{"pawkit - package installer for paw archives"};
    app.set_version_flag("-V,--version", PAWKIT_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "pawkit data directory");
    app.add_flag("--json", opts.json, "Machine-readable output where supported");
    app.add_flag("-d,--debug", opts.debug, "Debug logging");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("--allow-sudo", opts.allow_sudo,
                 "Use sudo for locations that need elevated permissions to remove");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install packages from files or repositories");
    commands::setup_install(install_cmd, opts, false);

    auto* finstall_cmd = app.add_subcommand("finstall", "Install, overwriting existing files");
    commands::setup_install(finstall_cmd, opts, true);

    auto* delete_cmd = app.add_subcommand("delete", "Remove installed packages");
    delete_cmd->alias("remove");
    delete_cmd->alias("uninstall");
    commands::setup_uninstall(delete_cmd, opts);

    auto* info_cmd = app.add_subcommand("info", "Show details of an installed package");
    commands::setup_info(info_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List installed packages");
    commands::setup_list(list_cmd, opts);

    auto* addrepo_cmd = app.add_subcommand("addrepo", "Add a package repository");
    commands::setup_addrepo(addrepo_cmd, opts);

    auto* removerepo_cmd = app.add_subcommand("removerepo", "Remove a package repository");
    commands::setup_removerepo(removerepo_cmd, opts);

    auto* update_cmd = app.add_subcommand("update", "Update a package, or all packages");
    commands::setup_update(update_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Get or set configuration values");
    commands::setup_config(config_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
