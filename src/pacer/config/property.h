/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */
#pragma once
#include "config/base_property.h"
#include "config/convert.h"
#include "json/json.h"

#include <seastar/util/noncopyable_function.hh>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <chrono>
#include <optional>
#include <ostream>
#include <type_traits>

namespace config {

namespace detail {
template<typename T>
consteval std::string_view property_type_name() {
    if constexpr (std::is_same_v<T, bool>) {
        return "boolean";
    } else if constexpr (std::is_integral_v<T>) {
        return "integer";
    } else if constexpr (std::is_same_v<T, std::chrono::seconds>) {
        return "seconds";
    } else if constexpr (std::is_same_v<T, std::chrono::milliseconds>) {
        return "milliseconds";
    } else if constexpr (std::is_same_v<T, ss::sstring>) {
        return "string";
    } else {
        static_assert(
          !std::is_same_v<T, T>, "property type needs a type name");
    }
}
} // namespace detail

template<class T>
class property : public base_property {
public:
    using value_type = T;
    using validator =
      typename ss::noncopyable_function<std::optional<ss::sstring>(const T&)>;

    property(
      config_store& conf,
      std::string_view name,
      std::string_view desc,
      base_property::metadata meta = {},
      value_type def = value_type{},
      property::validator validator = property::noop_validator)
      : base_property(conf, name, desc, meta)
      , _value(def)
      , _default(std::move(def))
      , _validator(std::move(validator)) {}

    const value_type& value() const { return _value; }

    std::string_view type_name() const override {
        return detail::property_type_name<value_type>();
    }

    bool is_default() const override { return _value == _default; }

    const value_type& operator()() const { return value(); }
    operator value_type() const { return value(); } // NOLINT

    void print(std::ostream& o) const override {
        fmt::print(o, "{}:{}", name(), _value);
    }

    void to_json(json::Writer<json::StringBuffer>& w) const override {
        json::rjson_serialize(w, _value);
    }

    bool set_value(YAML::Node n) override {
        return update_value(n.as<value_type>());
    }

    template<typename U>
    requires std::constructible_from<value_type, U>
    bool set_value(U&& v) {
        return update_value(value_type(std::forward<U>(v)));
    }

    std::optional<validation_error> validate(const value_type& v) const {
        if (auto err = _validator(v); err) {
            return std::make_optional<validation_error>(
              ss::sstring(name()), *err);
        }
        return std::nullopt;
    }

    std::optional<validation_error> validate(YAML::Node n) const override {
        return validate(n.as<value_type>());
    }

    void reset() override { update_value(value_type(_default)); }

    constexpr static auto noop_validator = [](const auto&) {
        return std::optional<ss::sstring>{};
    };

protected:
    bool update_value(value_type&& new_value) {
        if (new_value == _value) {
            return false;
        }
        _value = std::move(new_value);
        return true;
    }

    value_type _value;
    value_type _default;

private:
    validator _validator;
};

} // namespace config
