#include <string>
#include <string_view>

#include "environment.hpp"

#include <error/error.hpp>

environment::environment(const environment* outer_env)
    : outer(outer_env)
{
}

auto environment::get(std::string_view name) const -> integer_value
{
    const auto key = std::string {name};
    for (const auto* ptr = this; ptr != nullptr; ptr = ptr->outer) {
        if (const auto itr = ptr->store.find(key); itr != ptr->store.end()) {
            return itr->second;
        }
    }
    fail_evaluation("undefined variable: {}", name);
}

auto environment::set(const std::string& name, integer_value val) -> void
{
    store[name] = val;
}
