/**
 * pawkit CLI - list command
 *
 * List installed packages, or configured repositories.
 */

#include "../common.hpp"
#include <pawkit/repository.hpp>
#include <CLI/CLI.hpp>

namespace pawkit::cli::commands {

namespace {

struct ListOptions {
    bool repos = false;
};

int list_repositories(const GlobalOptions& opts, const PawkitPaths& paths) {
    RepoStore repos(paths.repos_file);
    auto listed = repos.list();
    if (!listed.ok) {
        print_error(listed.error);
        return 1;
    }

    if (opts.json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& repo : listed.repositories) {
            out.push_back({{"name", repo.name}, {"url", repo.url},
                           {"addedDate", repo.added_date}, {"lastUpdated", repo.last_updated}});
        }
        output_json(out);
        return 0;
    }

    if (listed.repositories.empty()) {
        std::cout << "No repositories configured" << std::endl;
        return 0;
    }
    for (const auto& repo : listed.repositories) {
        std::cout << repo.name << "  " << repo.url << std::endl;
    }
    return 0;
}

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    configure_logging(opts);
    auto paths = get_pawkit_paths(resolve_root(opts));

    if (list_opts.repos) {
        return list_repositories(opts, paths);
    }

    ManifestStore store(paths.manifest_file);
    auto listed = store.list();
    if (!listed.ok) {
        print_error(listed.error);
        return 1;
    }

    if (opts.json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& [name, record] : listed.records) {
            out.push_back({{"name", name}, {"version", record.version},
                           {"installDate", record.install_date},
                           {"files", record.files.size()}});
        }
        output_json(out);
        return 0;
    }

    if (listed.records.empty()) {
        std::cout << "No packages installed" << std::endl;
        return 0;
    }
    for (const auto& [name, record] : listed.records) {
        const auto& attrs = record.descriptor.attributes;
        std::cout << name << " " << record.version << std::endl;
        if (auto it = attrs.find("description"); it != attrs.end() && it->is_string()) {
            std::cout << "  " << it->get<std::string>() << std::endl;
        }
        if (auto it = attrs.find("author"); it != attrs.end() && it->is_string()) {
            std::cout << "  Author:    " << it->get<std::string>() << std::endl;
        }
        std::cout << "  Installed: " << record.install_date << std::endl;
        std::cout << "  Files:     " << record.files.size() << std::endl;
    }
    return 0;
}

} // namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_flag("--repos", list_opts.repos, "List configured repositories instead");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace pawkit::cli::commands
