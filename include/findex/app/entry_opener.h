// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>
#include <findex/metadata/catalog_types.h>

namespace findex::app {

/**
 * @brief Hands a catalog entry to the desktop: files open with their default
 * application, folders in the file browser.
 */
class IEntryOpener {
public:
    virtual ~IEntryOpener() = default;

    /**
     * @return true if the platform launcher reported success
     */
    virtual bool openEntry(const metadata::FileSystemEntry& entry) = 0;
};

/**
 * @brief Opens entries with `xdg-open` (Linux) or `open` (macOS).
 *
 * The launcher is run synchronously and its exit status decides the result.
 */
class SystemEntryOpener : public IEntryOpener {
public:
    SystemEntryOpener();
    explicit SystemEntryOpener(std::string launcher);

    bool openEntry(const metadata::FileSystemEntry& entry) override;

    const std::string& launcher() const { return launcher_; }

private:
    std::string launcher_;

    int runLauncher(const std::vector<std::string>& args) const;
};

} // namespace findex::app
