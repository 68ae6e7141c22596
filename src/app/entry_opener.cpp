// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <findex/app/entry_opener.h>

namespace findex::app {

namespace {

const char* defaultLauncher() {
#if defined(__APPLE__)
    return "open";
#else
    return "xdg-open";
#endif
}

} // namespace

SystemEntryOpener::SystemEntryOpener() : launcher_(defaultLauncher()) {}

SystemEntryOpener::SystemEntryOpener(std::string launcher) : launcher_(std::move(launcher)) {}

bool SystemEntryOpener::openEntry(const metadata::FileSystemEntry& entry) {
    std::error_code ec;
    if (!std::filesystem::exists(entry.path, ec)) {
        spdlog::warn("[EntryOpener] Failed to open '{}': path no longer exists", entry.path);
        return false;
    }

    const int status = runLauncher({launcher_, entry.path});
    if (status != 0) {
        spdlog::warn("[EntryOpener] Failed to open '{}': {} exited with status {}", entry.path,
                     launcher_, status);
        return false;
    }

    spdlog::info("[EntryOpener] Opened {} '{}'", metadata::EntryKindUtils::toString(entry.kind),
                 entry.path);
    return true;
}

int SystemEntryOpener::runLauncher(const std::vector<std::string>& args) const {
    if (args.empty())
        return -1;

    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == 0) {
        execvp(argv[0], argv.data());
        _exit(127);
    }
    if (pid < 0) {
        spdlog::error("[EntryOpener] fork() failed: {}", std::strerror(errno));
        return -1;
    }

    int status = 0;
    if (waitpid(pid, &status, 0) < 0) {
        spdlog::error("[EntryOpener] waitpid() failed: {}", std::strerror(errno));
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // namespace findex::app
