#pragma once

#include "pawkit/bundle.hpp"
#include "pawkit/toolset.hpp"
#include "pawkit/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Confirmation Gate
// ============================================================================

// Returns true to proceed. Receives the plan so the caller can preview
// destinations and conflicts.
using ConfirmCallback = std::function<bool(const InstallPlan& plan)>;

using ProgressCallback = std::function<void(const ProgressEvent& event)>;

struct GateResult {
    bool proceed = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
};

// The single user-facing decision point before any write.
// - force: never asks; conflicts are logged as a warning
// - conflicts or confirm_installation: asks the callback; decline aborts
// - no callback: conflicts fail with ConflictError, otherwise proceed
GateResult check_confirmation(const InstallPlan& plan, bool force, bool confirm_installation,
                              const ConfirmCallback& confirm);

// ============================================================================
// Materialization
// ============================================================================

struct MaterializeOptions {
    bool force = false;
    bool confirm_installation = false;
    ConfirmCallback confirm;
    ProgressCallback on_progress;
};

struct MaterializeResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;

    std::vector<std::string> installed;     // Unique, plan order, metadata excluded
    std::vector<std::string> warnings;
};

// Execute a plan. Whole-bundle copies run first; everything else is
// installed entry by entry. The first unrecoverable failure stops the run
// with IOError and leaves already written files in place.
MaterializeResult materialize(const InstallPlan& plan,
                              const BundleGrouping& grouping,
                              const MaterializeOptions& options,
                              const Toolset& tools);

} // namespace pawkit
