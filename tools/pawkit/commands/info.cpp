/**
 * pawkit CLI - info command
 *
 * Show the installed record of a package.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pawkit::cli::commands {

namespace {

struct InfoOptions {
    std::string name;
};

int cmd_info(const GlobalOptions& opts, const InfoOptions& info_opts) {
    configure_logging(opts);
    auto paths = get_pawkit_paths(resolve_root(opts));

    ManifestStore store(paths.manifest_file);
    auto loaded = store.load(info_opts.name);
    if (!loaded.ok) {
        if (loaded.code == ErrorCode::NotFound) {
            print_error("package '" + info_opts.name + "' is not installed");
        } else {
            print_error(loaded.error);
        }
        return 1;
    }

    const auto& record = loaded.record;
    if (opts.json) {
        auto j = record_to_json(record);
        j["name"] = info_opts.name;
        output_json(j);
        return 0;
    }

    std::cout << info_opts.name << " " << record.version << std::endl;
    std::cout << "  Installed: " << record.install_date << std::endl;
    if (!record.source.empty()) {
        std::cout << "  Source:    " << record.source << std::endl;
    }
    if (!record.package_hash.empty()) {
        std::cout << "  Hash:      " << record.package_hash << std::endl;
    }
    std::cout << "  Files:     " << record.files.size() << std::endl;

    for (auto it = record.descriptor.attributes.begin();
         it != record.descriptor.attributes.end(); ++it) {
        if (it.key() == "name" || it.key() == "version" || it.key() == "deletePaths") continue;
        std::cout << "  " << it.key() << ": "
                  << (it.value().is_string() ? it.value().get<std::string>() : it.value().dump())
                  << std::endl;
    }

    if (!record.descriptor.extra_paths.empty()) {
        std::cout << "  Extra paths:" << std::endl;
        for (const auto& path : record.descriptor.extra_paths) {
            std::cout << "    " << path << std::endl;
        }
    }

    std::cout << std::endl;
    for (const auto& file : record.files) {
        std::cout << (path_lexists(file) ? "  [ok]      " : "  [missing] ") << file << std::endl;
    }

    return 0;
}

} // namespace

void setup_info(CLI::App* app, GlobalOptions& opts) {
    static InfoOptions info_opts;

    app->add_option("name", info_opts.name, "Installed package name")->required();

    app->callback([&opts]() {
        std::exit(cmd_info(opts, info_opts));
    });
}

} // namespace pawkit::cli::commands
