#pragma once

#include <cstddef>

/**
 * @brief Constants used throughout the codebase
 *
 * Centralizes magic numbers and fixed names to improve maintainability.
 */
namespace trackr {

namespace Constants {
    // Configuration
    constexpr const char* CONFIG_FILENAME = ".trackr.yml";           // Under $HOME
    constexpr const char* SYSTEM_CONFIG_PATH = "/etc/trackr.yml";    // Loaded first, overridden by user file
    constexpr const char* DEFAULT_API_URL = "https://www.pivotaltracker.com/services/v5";
    constexpr long DEFAULT_TIMEOUT_SECONDS = 30;

    // Remote service
    constexpr const char* TOKEN_HEADER = "X-TrackerToken";
    constexpr long HTTP_ERROR_THRESHOLD = 400;

    // Rendering
    constexpr size_t DIVIDER_WIDTH = 50;           // '=' characters between stories
    constexpr size_t STORY_LABEL_WIDTH = 14;       // "Requested By: " column
    constexpr size_t PROJECT_LABEL_WIDTH = 21;     // "Weeks per Iteration: " column
    constexpr size_t NOTE_INDENT = 4;              // Note body indent inside a notes block
}
}
