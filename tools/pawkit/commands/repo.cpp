/**
 * pawkit CLI - addrepo / removerepo commands
 */

#include "../common.hpp"
#include <pawkit/repository.hpp>
#include <CLI/CLI.hpp>

namespace pawkit::cli::commands {

namespace {

struct AddRepoOptions {
    std::string url;
};

struct RemoveRepoOptions {
    std::string name;
};

int cmd_addrepo(const GlobalOptions& opts, const AddRepoOptions& add_opts) {
    configure_logging(opts);
    auto paths = get_pawkit_paths(resolve_root(opts));

    std::string error;
    if (!ensure_pawkit_structure(paths, error)) {
        print_error(error);
        return 1;
    }

    RepoStore repos(paths.repos_file);
    auto added = repos.add(add_opts.url);
    if (!added.ok) {
        print_error(added.error);
        return 1;
    }

    print_success("Added repository " + added.entry.name);
    return 0;
}

int cmd_removerepo(const GlobalOptions& opts, const RemoveRepoOptions& remove_opts) {
    configure_logging(opts);
    auto paths = get_pawkit_paths(resolve_root(opts));

    RepoStore repos(paths.repos_file);
    auto removed = repos.remove(remove_opts.name);
    if (!removed.ok) {
        print_error(removed.error);
        return 1;
    }

    print_success("Removed repository " + remove_opts.name);
    return 0;
}

} // namespace

void setup_addrepo(CLI::App* app, GlobalOptions& opts) {
    static AddRepoOptions add_opts;

    app->add_option("url", add_opts.url, "Repository index URL or file path")->required();

    app->callback([&opts]() {
        std::exit(cmd_addrepo(opts, add_opts));
    });
}

void setup_removerepo(CLI::App* app, GlobalOptions& opts) {
    static RemoveRepoOptions remove_opts;

    app->add_option("name", remove_opts.name, "Repository name")->required();

    app->callback([&opts]() {
        std::exit(cmd_removerepo(opts, remove_opts));
    });
}

} // namespace pawkit::cli::commands
