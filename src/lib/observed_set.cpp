#include "observed_set.hpp"

#include <string_view>

#ifndef REVSTAMP_OBSERVED_FILES
#define REVSTAMP_OBSERVED_FILES "lai.tex"
#endif

// Entries are separated by '|', empty entries are skipped.
static std::vector<fs::path> split_paths(std::string_view list) {
    std::vector<fs::path> out;
    std::size_t begin = 0;
    while (begin <= list.size()) {
        std::size_t bar = list.find('|', begin);
        if (bar == std::string_view::npos) bar = list.size();
        if (bar > begin) {
            out.emplace_back(std::string(list.substr(begin, bar - begin)));
        }
        begin = bar + 1;
    }
    return out;
}

ObservedSet ObservedSet::from_build_config() {
    return ObservedSet{split_paths(REVSTAMP_OBSERVED_FILES)};
}
