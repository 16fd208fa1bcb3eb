//
// Created by cv2 on 10/2/26.
//

#pragma once

#include "ui.h"

#include <iostream>
#include <string>
#include <source_location>

namespace zkg::log {

    inline void print(const std::string& level, const char* color_code, const std::string& msg) {
        std::cout << ui::color(color_code) << "zkg :: [" << level << "] :: " << ui::color("\033[0m") << msg << std::endl;
    }

    inline void ok(const std::string& msg) {
        print("OK", "\033[1;32m", msg); // Bold Green
    }

    inline void error(const std::string& msg, const std::source_location& loc = std::source_location::current()) {
        std::string full_msg = msg + " (at " + loc.file_name() + ":" + std::to_string(loc.line()) + ")";
        print("ER", "\033[1;31m", full_msg); // Bold Red
    }

    inline void info(const std::string& msg) {
        print("..", "\033[1;34m", msg); // Bold Blue
    }

    inline void warn(const std::string& msg) {
        print("WN", "\033[1;33m", msg); // Bold Yellow
    }

} // namespace zkg::log
