/**
 * pawkit CLI - update command
 *
 * Update one package, or every installed package with "all".
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pawkit::cli::commands {

namespace {

struct UpdateOptions {
    std::string target = "all";
    bool force = false;
};

int cmd_update(const GlobalOptions& opts, const UpdateOptions& update_opts) {
    auto ctx = open_engine(opts);

    pawkit::InstallOptions options;
    options.force = update_opts.force;
    options.on_progress = make_progress_printer(opts);
    options.confirm_update = [](const std::string& name, const std::string& installed,
                                const std::string& latest) {
        return prompt_yes_no("Update " + name + " from " + installed + " to " + latest + "?");
    };

    if (update_opts.target == "all") {
        auto result = update_all(ctx, options);
        if (!result.ok) {
            print_error(result.error);
            return 1;
        }
        for (const auto& err : result.errors) {
            print_error(err);
        }
        std::cout << result.updated << " updated, " << result.up_to_date << " up to date, "
                  << result.failed << " failed" << std::endl;
        return result.failed == 0 ? 0 : 1;
    }

    auto result = update_package(ctx, update_opts.target, options);
    print_removal_failures(result.removal_failures);
    if (!result.ok) {
        print_error(result.error);
        return 1;
    }

    if (result.updated) {
        print_success("Updated " + update_opts.target + " to " + result.latest_version);
    } else {
        print_success(update_opts.target + " is up to date (" + result.installed_version + ")");
    }
    return 0;
}

} // namespace

void setup_update(CLI::App* app, GlobalOptions& opts) {
    static UpdateOptions update_opts;

    app->add_option("target", update_opts.target, "Package name, or \"all\"");
    app->add_flag("-f,--force", update_opts.force, "Update without asking");

    app->callback([&opts]() {
        std::exit(cmd_update(opts, update_opts));
    });
}

} // namespace pawkit::cli::commands
