#include "toolbridge/schema.hpp"
#include "toolbridge/error.hpp"
#include <cmath>

namespace toolbridge {

namespace {

bool matches_type(const std::string& type, const nlohmann::json& v) {
    if (type == "object")  return v.is_object();
    if (type == "array")   return v.is_array();
    if (type == "string")  return v.is_string();
    if (type == "boolean") return v.is_boolean();
    if (type == "null")    return v.is_null();
    if (type == "number")  return v.is_number();
    if (type == "integer") {
        if (v.is_number_integer()) return true;
        if (v.is_number_float()) {
            double d = v.get<double>();
            return std::isfinite(d) && std::trunc(d) == d;
        }
        return false;
    }
    return true; // unknown type keyword
}

std::string describe(const nlohmann::json& type) {
    return type.is_string() ? type.get<std::string>() : type.dump();
}

void check(const nlohmann::json& schema, const nlohmann::json& value, const std::string& path) {
    if (!schema.is_object()) return;

    if (auto t = schema.find("type"); t != schema.end()) {
        bool ok = false;
        if (t->is_string()) {
            ok = matches_type(t->get<std::string>(), value);
        } else if (t->is_array()) {
            for (const auto& alt : *t) {
                if (alt.is_string() && matches_type(alt.get<std::string>(), value)) {
                    ok = true;
                    break;
                }
            }
        } else {
            ok = true;
        }
        if (!ok) {
            throw InvalidArguments(path + ": expected " + describe(*t) + ", got "
                                   + std::string(value.type_name()));
        }
    }

    if (auto e = schema.find("enum"); e != schema.end() && e->is_array()) {
        bool found = false;
        for (const auto& allowed : *e) {
            if (allowed == value) { found = true; break; }
        }
        if (!found) {
            throw InvalidArguments(path + ": value " + value.dump() + " is not one of " + e->dump());
        }
    }

    if (value.is_number()) {
        double d = value.get<double>();
        if (auto m = schema.find("minimum"); m != schema.end() && m->is_number() && d < m->get<double>()) {
            throw InvalidArguments(path + ": " + value.dump() + " is below minimum " + m->dump());
        }
        if (auto m = schema.find("maximum"); m != schema.end() && m->is_number() && d > m->get<double>()) {
            throw InvalidArguments(path + ": " + value.dump() + " is above maximum " + m->dump());
        }
    }

    if (value.is_string()) {
        auto len = value.get_ref<const std::string&>().size();
        if (auto m = schema.find("minLength"); m != schema.end() && m->is_number_integer()
            && static_cast<long long>(len) < m->get<long long>()) {
            throw InvalidArguments(path + ": string shorter than " + m->dump());
        }
        if (auto m = schema.find("maxLength"); m != schema.end() && m->is_number_integer()
            && static_cast<long long>(len) > m->get<long long>()) {
            throw InvalidArguments(path + ": string longer than " + m->dump());
        }
    }

    if (value.is_object()) {
        if (auto req = schema.find("required"); req != schema.end() && req->is_array()) {
            for (const auto& name : *req) {
                if (name.is_string() && !value.contains(name.get<std::string>())) {
                    throw InvalidArguments(path + ": missing required argument '"
                                           + name.get<std::string>() + "'");
                }
            }
        }
        auto props = schema.find("properties");
        bool have_props = props != schema.end() && props->is_object();
        auto additional = schema.find("additionalProperties");
        bool closed = additional != schema.end() && additional->is_boolean() && !additional->get<bool>();

        for (auto it = value.begin(); it != value.end(); ++it) {
            const std::string child = path + "." + it.key();
            if (have_props && props->contains(it.key())) {
                check(props->at(it.key()), it.value(), child);
            } else if (closed) {
                throw InvalidArguments(child + ": unexpected argument");
            } else if (additional != schema.end() && additional->is_object()) {
                check(*additional, it.value(), child);
            }
        }
    }

    if (value.is_array()) {
        if (auto items = schema.find("items"); items != schema.end() && items->is_object()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                check(*items, value[i], path + "[" + std::to_string(i) + "]");
            }
        }
    }
}

} // anonymous namespace

void validate_arguments(const nlohmann::json& schema, const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        throw InvalidArguments("arguments must be a JSON object, got "
                               + std::string(arguments.type_name()));
    }
    check(schema, arguments, "arguments");
}

} // namespace toolbridge
