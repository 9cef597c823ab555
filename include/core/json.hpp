#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace sqlpage {

/**
 * @brief Thin read-only wrapper around glz::json_t
 *
 * Stores json_t by value. Const operator[] returns copies. Used to parse
 * staged result documents and request bodies; output JSON is written with
 * std::format + utils::escape_json.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool is_number_integer() const {
        if (!data_.is_number()) return false;
        double d = data_.get<double>();
        return d == std::floor(d) && std::isfinite(d);
    }

    // ===== Container Properties =====

    [[nodiscard]] size_t size() const {
        if (data_.is_array()) return data_.get_array().size();
        if (data_.is_object()) return data_.get_object().size();
        return 0;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double; cast to target integral type
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // Direct view into an array without copying every element
    [[nodiscard]] const array_t* as_array() const {
        return data_.is_array() ? &data_.get_array() : nullptr;
    }

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace sqlpage
