#pragma once

#include <atomic>
#include <string>

enum class Lang { EN, RU };

struct Strings {
    // General
    const char* app_title;
    const char* unknown_command;
    const char* config_invalid;

    // Status
    const char* status_running;
    const char* status_stale;
    const char* status_stopped;
    const char* hint_logs;
    const char* hint_stop;
    const char* hint_start;
    const char* hint_cleanup;

    // Start
    const char* start_already_running;
    const char* start_stale_removed;
    const char* start_script_missing;
    const char* start_env_missing;
    const char* start_env_hint;
    const char* launching;
    const char* launched;
    const char* launch_failed;
    const char* lock_write_failed;
    const char* lock_race_lost;

    // Environment
    const char* venv_creating;
    const char* venv_created;
    const char* venv_missing;
    const char* manifest_missing;
    const char* manifest_hint;
    const char* deps_first_install;
    const char* deps_manifest_changed;
    const char* deps_damaged;
    const char* deps_forced;
    const char* deps_installed;
    const char* deps_up_to_date;
    const char* deps_install_failed;
    const char* deps_install_hint;

    // Stop
    const char* stopping;
    const char* force_stopping;
    const char* stopped;
    const char* stop_already;
    const char* stop_stale_cleanup;
    const char* stop_done;
    const char* signal_failed;

    // Restart / update
    const char* restarting;
    const char* update_run_start_first;
    const char* update_done;
    const char* update_restart_hint;
};

#include "i18n/en.hpp"
#include "i18n/ru.hpp"

inline const Strings EN_STRINGS = EN_STRINGS_DEF;
inline const Strings RU_STRINGS = RU_STRINGS_DEF;
inline std::atomic<Lang> current_lang{Lang::EN};

inline const Strings& T() {
    return current_lang.load() == Lang::RU ? RU_STRINGS : EN_STRINGS;
}

/// "ru" selects Russian, anything else English
inline Lang lang_from_code(const std::string& code) {
    return code == "ru" ? Lang::RU : Lang::EN;
}
