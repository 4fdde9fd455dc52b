#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

extern "C" {
#include <json-c/json.h>
}

AppCfg parse_cfg(const std::string& s, const std::string& origin){
    json_object* root = json_tokener_parse(s.c_str());
    if (!root) throw UsageError(origin + ": JSON parse error");
    if (!json_object_is_type(root, json_type_object)) {
        json_object_put(root);
        throw UsageError(origin + ": top level must be a JSON object");
    }

    AppCfg c{};
    std::string bad;
    auto get=[&](const char* k, json_type t)->json_object*{
        json_object* v=nullptr;
        if (!json_object_object_get_ex(root,k,&v)) return nullptr;
        if (!json_object_is_type(v, t)) { if (bad.empty()) bad = k; return nullptr; }
        return v;
    };
    auto getS=[&](const char* k, std::string& out){
        if (json_object* v = get(k, json_type_string)) out = json_object_get_string(v);
    };
    auto getB=[&](const char* k, bool& out){
        if (json_object* v = get(k, json_type_boolean)) out = json_object_get_boolean(v) != 0;
    };
    auto getI=[&](const char* k, int def)->int{
        json_object* v = get(k, json_type_int);
        return v ? json_object_get_int(v) : def;
    };

    int min_len = getI("min_password_length", (int)c.policy.min_length);
    getB("require_lowercase", c.policy.require_lowercase);
    getB("require_uppercase", c.policy.require_uppercase);
    getB("require_digit", c.policy.require_digit);
    getB("require_special", c.policy.require_special);
    getS("special_characters", c.policy.special_characters);
    int version = getI("format_version", format_number(c.format_version));
    getB("minify", c.minify);
    getS("wrapper_title", c.wrapper_title);

    json_object_put(root);

    if (!bad.empty()) throw UsageError(origin + ": wrong type for \"" + bad + "\"");
    if (min_len < 0) throw UsageError(origin + ": min_password_length must not be negative");
    c.policy.min_length = (size_t)min_len;
    if (c.policy.require_special && c.policy.special_characters.empty())
        throw UsageError(origin + ": special_characters is empty but require_special is set");
    if (!try_format_version(version, c.format_version))
        throw UsageError(origin + ": unsupported format_version " + std::to_string(version));
    return c;
}

AppCfg load_cfg(const std::string& path){
    return parse_cfg(read_file(path), path);
}
