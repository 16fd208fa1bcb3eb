//
// Created by cv2 on 10/3/26.
//

#pragma once

#include "metadata.h"

#include <optional>
#include <string>
#include <vector>

namespace zkg {

    // A variable a package asks the user to provide at build time, e.g.
    //   LIBRDKAFKA_ROOT [/usr] "Path to librdkafka installation"
    struct UserVar {
        std::string name;
        std::optional<std::string> value;
        std::optional<std::string> description;

        UserVarTriple as_triple() const { return {name, value, description}; }
    };

    // Parses the 'user_vars' field. Absent (or blank) yields an empty list; any text that is
    // not a whitespace-separated sequence of NAME [value] "description" entries is malformed.
    FieldResult<std::vector<UserVar>> parse_user_vars(const Metadata& metadata);

} // namespace zkg
