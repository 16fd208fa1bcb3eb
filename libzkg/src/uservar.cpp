//
// Created by cv2 on 10/3/26.
//

#include "libzkg/uservar.h"
#include "libzkg/logging.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace zkg {

    FieldResult<std::vector<UserVar>> parse_user_vars(const Metadata& metadata) {
        auto it = metadata.find(fields::USER_VARS);
        if (it == metadata.end()) {
            return FieldResult<std::vector<UserVar>>::absent();
        }

        const std::string& text = it->second;
        auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        if (std::all_of(text.begin(), text.end(), is_space)) {
            return FieldResult<std::vector<UserVar>>::absent();
        }

        // NAME [default value] "description"
        static const std::regex entry_re(R"re((\w+)\s+\[([^\]]*)\]\s+"([^"]*)")re");

        std::vector<UserVar> result;
        auto pos = text.cbegin();

        while (true) {
            pos = std::find_if_not(pos, text.cend(), is_space);
            if (pos == text.cend()) {
                break;
            }

            std::smatch match;
            if (!std::regex_search(pos, text.cend(), match, entry_re, std::regex_constants::match_continuous)) {
                log::warn("Malformed 'user_vars' field near: " + std::string(pos, text.cend()));
                return FieldResult<std::vector<UserVar>>::malformed();
            }

            result.push_back(UserVar{match[1].str(), match[2].str(), match[3].str()});
            pos = match[0].second;
        }

        return FieldResult<std::vector<UserVar>>::present(std::move(result));
    }

} // namespace zkg
