//
// Created by cv2 on 10/2/26.
//

#pragma once

#include <unistd.h> // For isatty and STDOUT_FILENO

namespace zkg::ui {

    /**
     * @brief Checks if standard output is connected to an interactive terminal (TTY).
     * @return True if output is interactive, false otherwise (e.g., piped into a resolver log).
     */
    inline bool is_interactive() {
        return isatty(STDOUT_FILENO) != 0;
    }

    // Wraps a colour escape so it collapses to nothing when output is not a terminal.
    inline const char* color(const char* code) {
        return is_interactive() ? code : "";
    }

} // namespace zkg::ui
