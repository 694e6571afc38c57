/**
 * pawkit CLI - install / finstall commands
 *
 * Install packages from local archives or configured repositories.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pawkit::cli::commands {

namespace {

struct InstallCmdOptions {
    std::vector<std::string> targets;
    bool force = false;
    bool yes = false;
};

int cmd_install(const GlobalOptions& opts, const InstallCmdOptions& install_opts) {
    auto ctx = open_engine(opts);
    auto config = open_config(opts);

    pawkit::InstallOptions options;
    options.force = install_opts.force;
    options.confirm_installation =
        !install_opts.yes && config.get_bool("confirm_installation", true);
    options.confirm = make_plan_confirm();
    options.on_progress = make_progress_printer(opts);

    auto batch = install_batch(ctx, install_opts.targets, options);

    for (const auto& item : batch.items) {
        if (item.ok) {
            print_success("Installed " + item.target);
        } else {
            print_error(item.target + ": " + item.error);
        }
    }

    if (batch.items.size() > 1) {
        std::cout << "\n" << batch.succeeded() << " installed, " << batch.failed() << " failed"
                  << std::endl;
    }

    return batch.failed() == 0 ? 0 : 1;
}

} // namespace

void setup_install(CLI::App* app, GlobalOptions& opts, bool force) {
    static InstallCmdOptions install_opts;
    static InstallCmdOptions finstall_opts;
    InstallCmdOptions& o = force ? finstall_opts : install_opts;
    o.force = force;

    app->add_option("targets", o.targets, "Archive paths or repository package names")->required();
    if (!force) {
        app->add_flag("-f,--force", o.force, "Overwrite existing files");
    }
    app->add_flag("-y,--yes", o.yes, "Skip the installation preview");

    app->callback([&opts, &o]() {
        std::exit(cmd_install(opts, o));
    });
}

} // namespace pawkit::cli::commands
