#ifndef QPARAM_ARRAYSPLITTER_HPP
#define QPARAM_ARRAYSPLITTER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace qparam {

/**
 * splits one raw value into its array elements, e.g. 'developer,tester' -> {"developer", "tester"}
 * Elements are kept verbatim (no trimming). A value without delimiter yields one element and
 * an empty value yields one empty element.
 */
inline std::vector<std::string> splitArray(std::string_view raw, char delimiter = ',') {
    std::vector<std::string> elements;
    std::size_t              start = 0;
    while (true) {
        const auto end = raw.find(delimiter, start);
        if (end == std::string_view::npos) {
            elements.emplace_back(raw.substr(start));
            return elements;
        }
        elements.emplace_back(raw.substr(start, end - start));
        start = end + 1;
    }
}

} // namespace qparam

#endif // QPARAM_ARRAYSPLITTER_HPP
