// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>
#include <findex/app/file_actions.h>
#include <findex/core/types.h>
#include <findex/metadata/catalog_types.h>

namespace findex::cli {

class FindexCLI;

/**
 * Run an open/list action for the open and list commands and print the outcome.
 * NotFound and OpenFailed outcomes are reported as errors so the exit code reflects them.
 */
Result<void> runFileAction(FindexCLI* cli, app::FileAction action, metadata::EntryKind kind,
                           const std::vector<std::string>& targetWords);

} // namespace findex::cli
