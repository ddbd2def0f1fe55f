#include "liftoff/startup/entry_point.h"

#include <cstdlib>
#include <memory>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace liftoff {

std::string simple_type_name(std::string_view qualified_name) {
    // Drop template arguments at every nesting level
    std::string name;
    name.reserve(qualified_name.size());
    int depth = 0;
    for (char c : qualified_name) {
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            if (depth > 0) --depth;
        } else if (depth == 0) {
            name.push_back(c);
        }
    }

    auto scope = name.rfind("::");
    if (scope != std::string::npos) {
        name.erase(0, scope + 2);
    }

    return name;
}

std::string simple_type_name(const std::type_info& type) {
#if defined(__GNUC__) || defined(__clang__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return simple_type_name(std::string_view(demangled.get()));
    }
#endif
    return simple_type_name(std::string_view(type.name()));
}

} // namespace liftoff
