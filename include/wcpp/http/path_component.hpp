#pragma once

#include <concepts>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace wcpp {

/// One segment of an endpoint path. Empty or absent segments are dropped when
/// the path is built, so optional parameters can be listed unconditionally:
///
///   build_path({"users", user_id, "posts", maybe_post_id})
///     -> "/users/42/posts"  when maybe_post_id is nullopt
class PathComponent {
public:
    PathComponent(const char* literal) : value_(literal ? std::string(literal) : std::string()) {}
    PathComponent(std::string_view literal) : value_(literal) {}
    PathComponent(std::string value) : value_(std::move(value)) {}

    PathComponent(std::optional<std::string> value)
        : value_(value ? std::move(*value) : std::string()) {}

    template <std::integral Int>
    PathComponent(Int number) : value_(std::to_string(number)) {}

    template <std::integral Int>
    PathComponent(std::optional<Int> number)
        : value_(number ? std::to_string(*number) : std::string()) {}

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] bool empty() const noexcept { return value_.empty(); }

private:
    std::string value_;
};

/// "/" + non-empty components joined by "/", or "/" when none remain.
[[nodiscard]] inline std::string build_path(std::initializer_list<PathComponent> components) {
    std::string path;
    for (const auto& component : components) {
        if (component.empty()) {
            continue;
        }
        path.push_back('/');
        path.append(component.value());
    }
    if (path.empty()) {
        path = "/";
    }
    return path;
}

}  // namespace wcpp
