#include <batchgrader/config.hpp>

#include <set>
#include <string>
#include <utility>

namespace batchgrader {

FileSelection make_file_selection(std::set<std::string> names) {
    if (names.empty()) {
        return CollectAll{};
    }

    return CollectNamed{.names = std::move(names)};
}

} // namespace batchgrader
