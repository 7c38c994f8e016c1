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
#include "base/seastarx.h"
#include "config/validation_error.h"
#include "json/json.h"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace config {

class config_store;

enum class required : char {
    yes,
    no,
};

enum class needs_restart : char {
    yes,
    no,
};

enum class visibility : char {
    // Implementation details of pacing, e.g. probe intervals
    tunable,
    // Settings an operator is expected to change
    user,
};

std::string_view to_string_view(visibility v);

class base_property {
public:
    struct meta {
        required required{required::no};
        needs_restart needs_restart{needs_restart::yes};
        std::string_view example;
        visibility visibility{visibility::user};
    };

    struct metadata {
        consteval metadata() {}
        consteval metadata(meta md) {
            flags = 0;
            if (md.needs_restart == needs_restart::yes) {
                flags |= restart_flag;
            }
            if (md.required == required::yes) {
                flags |= required_flag;
            }
            if (md.visibility == visibility::tunable) {
                flags |= tunable_flag;
            }
            example = md.example.data();
        }

        static constexpr uint8_t restart_flag = 1;
        static constexpr uint8_t required_flag = 2;
        static constexpr uint8_t tunable_flag = 4;

        uint8_t flags = restart_flag;
        const char* example = nullptr;
    };

    base_property(
      config_store& conf,
      std::string_view name,
      std::string_view desc,
      metadata meta);

    base_property(const base_property&) = delete;
    base_property(base_property&&) = delete;
    base_property& operator=(base_property&&) = delete;

    const std::string_view& name() const { return _name; }
    const std::string_view& desc() const { return _desc; }

    required is_required() const {
        return (_meta.flags & metadata::required_flag) != 0 ? required::yes
                                                            : required::no;
    }
    bool needs_restart() const {
        return (_meta.flags & metadata::restart_flag) != 0;
    }
    visibility get_visibility() const {
        return (_meta.flags & metadata::tunable_flag) != 0 ? visibility::tunable
                                                           : visibility::user;
    }
    std::optional<std::string_view> example() const {
        if (_meta.example == nullptr || *_meta.example == '\0') {
            return std::nullopt;
        }
        return std::string_view(_meta.example);
    }

    // Serializes the value only; config_store::to_json writes the key.
    virtual void to_json(json::Writer<json::StringBuffer>& w) const = 0;

    virtual void print(std::ostream&) const = 0;
    /// Returns true when the stored value changed.
    virtual bool set_value(YAML::Node) = 0;
    virtual void reset() = 0;
    virtual bool is_default() const = 0;
    virtual std::string_view type_name() const = 0;

    /// Validation of a proposed value before it is assigned.
    virtual std::optional<validation_error> validate(YAML::Node) const = 0;
    virtual ~base_property() noexcept = default;

private:
    friend std::ostream& operator<<(std::ostream&, const base_property&);
    std::string_view _name;
    std::string_view _desc;

protected:
    const metadata _meta;
};

} // namespace config
