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
#include "config/property.h"
#include "json/json.h"

#include <seastar/core/sstring.hh>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <map>
#include <set>
#include <stdexcept>
#include <string_view>

namespace config {

class config_store {
public:
    config_store() = default;
    config_store(const config_store&) = delete;
    config_store& operator=(const config_store&) = delete;
    config_store(config_store&&) = delete;
    config_store& operator=(config_store&&) = delete;
    virtual ~config_store() noexcept = default;

    bool contains(std::string_view name) const {
        return _properties.contains(name);
    }

    base_property& get(std::string_view name) {
        if (auto found = _properties.find(name); found != _properties.end()) {
            return *(found->second);
        }
        throw std::out_of_range(fmt::format("Property {} not found", name));
    }

    using error_map_t = std::map<ss::sstring, ss::sstring>;

    /**
     * Missing properties whose metadata says `required::yes` and unknown
     * property names are fatal and raised as std::invalid_argument.
     *
     * Every other problem with a value (malformed YAML, wrong type, a
     * validator complaint) is returned in a map of property name to error
     * message. A value that fails its validator is not assigned.
     *
     * @return map of property name to error, empty on a clean load
     */
    virtual error_map_t read_yaml(const YAML::Node& root_node) {
        error_map_t errors;

        for (const auto& [name, property] : _properties) {
            if (property->is_required() == required::no) {
                continue;
            }
            if (!root_node[std::string(name)]) {
                throw std::invalid_argument(
                  fmt::format("Property {} is required", name));
            }
        }

        for (const auto& node : root_node) {
            auto name = node.first.as<ss::sstring>();
            auto found = _properties.find(std::string_view(name));
            if (found == _properties.end()) {
                throw std::invalid_argument(
                  fmt::format("Unknown property {}", name));
            }
            auto* prop = found->second;

            bool ok = false;
            try {
                auto validation_err = prop->validate(node.second);
                if (validation_err.has_value()) {
                    errors[name] = fmt::format(
                      "Validation error: {}",
                      validation_err.value().error_message());
                } else {
                    prop->set_value(node.second);
                    ok = true;
                }
            } catch (const YAML::InvalidNode& e) {
                errors[name] = fmt::format("Invalid syntax: {}", e.what());
            } catch (const YAML::ParserException& e) {
                errors[name] = fmt::format("Invalid syntax: {}", e.what());
            } catch (const YAML::BadConversion& e) {
                errors[name] = fmt::format("Invalid value: {}", e.what());
            }

            if (!ok && prop->is_required() == required::yes) {
                throw std::invalid_argument(fmt::format(
                  "Property {} is required and has invalid value", name));
            }
        }

        return errors;
    }

    template<typename Func>
    void for_each(Func&& f) const {
        for (const auto& [_, property] : _properties) {
            f(*property);
        }
    }

    void to_json(json::Writer<json::StringBuffer>& w) const {
        w.StartObject();
        for (const auto& [name, property] : _properties) {
            w.Key(name.data(), name.size());
            property->to_json(w);
        }
        w.EndObject();
    }

    std::set<std::string_view> property_names() const {
        std::set<std::string_view> result;
        for (const auto& i : _properties) {
            result.insert(i.first);
        }
        return result;
    }

    friend std::ostream&
    operator<<(std::ostream& o, const config::config_store& c) {
        o << "{ ";
        c.for_each([&o](const auto& property) { o << property << " "; });
        o << "}";
        return o;
    }

private:
    friend class base_property;
    std::map<std::string_view, base_property*, std::less<>> _properties;
};

} // namespace config
