/**
 * pawkit CLI - Common utilities and types
 */

#pragma once

#include <pawkit/config_store.hpp>
#include <pawkit/installer.hpp>
#include <pawkit/remover.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <iostream>
#include <optional>
#include <set>
#include <string>

namespace pawkit::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    bool json = false;             // --json
    bool debug = false;            // -d, --debug
    bool verbose = false;          // -v, --verbose
    bool allow_sudo = false;       // --allow-sudo
};

inline std::string resolve_root(const GlobalOptions& opts) {
    return resolve_pawkit_root(opts.root.empty() ? std::nullopt : std::make_optional(opts.root));
}

inline ConfigStore open_config(const GlobalOptions& opts) {
    return ConfigStore(get_pawkit_paths(resolve_root(opts)).config_file);
}

/**
 * Set the log level once from flags and the stored configuration.
 */
inline void configure_logging(const GlobalOptions& opts) {
    auto config = open_config(opts);
    bool debug = opts.debug || config.get_bool("debug", false);
    bool verbose = opts.verbose || config.get_bool("verbose_logging", false);

    if (debug) {
        spdlog::set_level(spdlog::level::debug);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::info);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
    spdlog::set_pattern("%^%l%$: %v");
}

inline EngineContext open_engine(const GlobalOptions& opts) {
    configure_logging(opts);
    return make_engine_context(resolve_root(opts), opts.allow_sudo);
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg) {
    std::cerr << "Error: " << msg << std::endl;
}

inline void print_success(const std::string& msg) {
    std::cout << msg << std::endl;
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline bool prompt_yes_no(const std::string& question) {
    std::cout << question << " (y/n): " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    for (auto& c : answer) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return answer == "y" || answer == "yes";
}

/**
 * Plan preview shown at the confirmation gate.
 */
inline ConfirmCallback make_plan_confirm() {
    return [](const InstallPlan& plan) {
        constexpr size_t kPreviewLimit = 10;

        std::set<std::string> unique;
        size_t listed = 0;
        std::cout << "\nThe following files will be installed:" << std::endl;
        for (const auto& entry : plan.entries) {
            if (entry.is_metadata || !unique.insert(entry.destination).second) continue;
            if (listed < kPreviewLimit) {
                std::cout << "  " << entry.destination << std::endl;
                ++listed;
            }
        }
        if (unique.size() > kPreviewLimit) {
            std::cout << "  ... and " << (unique.size() - kPreviewLimit) << " more files" << std::endl;
        }

        if (plan.has_conflicts()) {
            std::cout << "\nThese files already exist and will be overwritten:" << std::endl;
            for (const auto& path : plan.conflicts) {
                std::cout << "  " << path << std::endl;
            }
        }

        return prompt_yes_no("\nProceed with installation?");
    };
}

inline ProgressCallback make_progress_printer(const GlobalOptions& opts) {
    bool verbose = opts.verbose || opts.debug;
    return [verbose](const ProgressEvent& event) {
        switch (event.kind) {
            case ProgressKind::FileInstalled:
            case ProgressKind::SymlinkInstalled:
            case ProgressKind::BundleInstalled:
                if (verbose) std::cout << "  + " << event.path << std::endl;
                break;
            case ProgressKind::PathRemoved:
                if (verbose) std::cout << "  - " << event.path << std::endl;
                break;
            case ProgressKind::DirectoryCreated:
                break;
            case ProgressKind::Warning:
                std::cerr << "Warning: " << event.detail << std::endl;
                break;
        }
    };
}

inline void print_removal_failures(const std::vector<RemovalFailure>& failed) {
    if (failed.empty()) return;
    std::cerr << "\n" << format_failure_report(failed, get_current_platform());
}

} // namespace pawkit::cli
