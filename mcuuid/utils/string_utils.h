#pragma once

#include <string>
#include <vector>

namespace mcuuid::utils {

inline std::string join(const std::vector<std::string>& inputs, const std::string& separator) {
    std::string result;
    for (const auto& item : inputs) {
        if (!result.empty()) {
            result += separator;
        }
        result += item;
    }
    return result;
}

}  // namespace mcuuid::utils
