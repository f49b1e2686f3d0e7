#pragma once

// English string table - included by i18n.hpp after Strings is defined

inline constexpr Strings EN_STRINGS_DEF = {
    // General
    "Telegram Bot Manager",
    "Unknown command: ",
    "Invalid config file, using defaults: ",

    // Status
    "Bot is running",
    "Found a lock file, but the process is not running",
    "Bot is not running",
    "Logs: tail -f ",
    "Stop: botctl stop",
    "Start: botctl start",
    "Clean up: botctl stop, or remove ",

    // Start
    "Bot is already running",
    "Removing stale lock file, the previous run did not shut down cleanly...",
    "Bot script not found: ",
    "Env file not found: ",
    "Create it with BOT_TOKEN=<your token>",
    "Starting bot...",
    "Bot started",
    "Failed to launch bot: ",
    "Cannot write lock file: ",
    "Another instance took the lock first, the new process was stopped",

    // Environment
    "Creating virtual environment...",
    "Virtual environment created",
    "Virtual environment not found",
    "Dependency manifest not found: ",
    "Check the manifest path (runtime.manifest in botctl.yaml)",
    "Installing dependencies for the first time...",
    "Dependency manifest changed, updating dependencies...",
    "Dependencies are damaged, reinstalling...",
    "Forcing dependency update...",
    "Dependencies installed",
    "Dependencies are up to date",
    "Dependency installation failed",
    "Fix the manifest or the network and run the command again",

    // Stop
    "Stopping bot",
    "Bot did not exit in time, forcing stop...",
    "Bot stopped",
    "Bot is already stopped",
    "Cleaning up stale lock file...",
    "Done",
    "Cannot signal the bot process: ",

    // Restart / update
    "Restarting bot...",
    "Run first: botctl start",
    "Dependencies updated",
    "Restart the bot to apply: botctl restart",
};
