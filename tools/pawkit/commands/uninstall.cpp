/**
 * pawkit CLI - delete command
 *
 * Remove installed packages. Also available as "remove" and "uninstall".
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pawkit::cli::commands {

namespace {

struct UninstallOptions {
    std::vector<std::string> names;
};

int cmd_uninstall(const GlobalOptions& opts, const UninstallOptions& uninstall_opts) {
    auto ctx = open_engine(opts);

    auto batch = uninstall_batch(ctx, uninstall_opts.names, make_progress_printer(opts));

    int rc = 0;
    for (const auto& item : batch.items) {
        if (!item.ok) {
            print_error(item.target + ": " + item.error);
            rc = 1;
            continue;
        }
        if (item.failed.empty()) {
            print_success("Removed " + item.target);
        } else {
            print_success("Removed " + item.target + " (some files could not be deleted)");
            print_removal_failures(item.failed);
            rc = 1;
        }
    }
    return rc;
}

} // namespace

void setup_uninstall(CLI::App* app, GlobalOptions& opts) {
    static UninstallOptions uninstall_opts;

    app->add_option("names", uninstall_opts.names, "Installed package names")->required();

    app->callback([&opts]() {
        std::exit(cmd_uninstall(opts, uninstall_opts));
    });
}

} // namespace pawkit::cli::commands
