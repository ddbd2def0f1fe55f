#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>

namespace liftoff {

/**
 * @brief Identity of the application being launched
 *
 * `anchor` is any address inside the executable or shared object that
 * defines the application. HomeLocator resolves it to the module's path on
 * disk. A null anchor means the source location is unknown.
 */
struct EntryPoint {
    std::string name;                       ///< Simple application name
    std::optional<std::string> version;     ///< Implementation version, if any
    const void* anchor = nullptr;           ///< Address inside the defining module
};

/**
 * @brief Strip namespaces and template arguments from a demangled type name
 *
 * `acme::web::Server<int>` becomes `Server`.
 */
[[nodiscard]] std::string simple_type_name(std::string_view qualified_name);

/**
 * @brief Human-readable simple name of a type (demangled where supported)
 */
[[nodiscard]] std::string simple_type_name(const std::type_info& type);

/**
 * @brief Types that publish an implementation version as `static ... version`
 */
template<typename T>
concept HasVersion = requires {
    { T::version } -> std::convertible_to<std::string_view>;
};

namespace detail {

// Instantiated in the translation unit that names T, so its address lies in
// the module that defines the application
template<typename T>
void entry_anchor() {}

} // namespace detail

/**
 * @brief Build the entry point for application type T
 *
 * @example
 * ```cpp
 * struct Gateway : liftoff::Application {
 *     static constexpr const char* version = "1.4.0";
 *     void run() override;
 * };
 * auto entry = liftoff::entry_point_of<Gateway>();  // name "Gateway", version "1.4.0"
 * ```
 */
template<typename T>
EntryPoint entry_point_of() {
    EntryPoint entry;
    entry.name = simple_type_name(typeid(T));
    if constexpr (HasVersion<T>) {
        std::string_view version = T::version;
        if (!version.empty()) {
            entry.version = std::string(version);
        }
    }
    entry.anchor = reinterpret_cast<const void*>(&detail::entry_anchor<T>);
    return entry;
}

} // namespace liftoff
