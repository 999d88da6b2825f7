#pragma once

#include <optional>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include <spikeflowio/jsonio.hpp>

namespace spikeflowio {

// Search a json object for an entry with a given name.
// If found, return the value and remove from json object.
template <typename T>
std::optional<T> find_and_remove_json(const char* name, nlohmann::json& j) {
    auto it = j.find(name);
    if (it==j.end()) {
        return std::nullopt;
    }
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (!it->is_number_unsigned()) {
            throw jsonio_load_error(name, "expected a non-negative integer, got " + it->dump());
        }
    }
    T value;
    try {
        value = it->get<T>();
    }
    catch (nlohmann::json::exception& e) {
        throw jsonio_load_error(name, e.what());
    }
    j.erase(name);
    return value;
}

// As above, for entries without a default.
template <typename T>
T find_and_remove_required_json(const char* name, nlohmann::json& j) {
    if (auto value = find_and_remove_json<T>(name, j)) {
        return std::move(*value);
    }
    throw jsonio_missing_field(name);
}

template <typename T>
void param_from_json(T& x, const char* name, nlohmann::json& j) {
    if (auto o = find_and_remove_json<T>(name, j)) {
        x = std::move(*o);
    }
}

// Every recognised entry has been removed; anything left is a mistake.
void throw_if_not_empty(const nlohmann::json& j);

} // namespace spikeflowio
