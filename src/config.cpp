#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

extern "C" {
#include <json-c/json.h>
}

AppCfg parse_cfg(const std::string& s){
    json_object* root = json_tokener_parse(s.c_str());
    if (!root) throw ConfigError("config parse error");
    if (!json_object_is_type(root, json_type_object)) { json_object_put(root); throw ConfigError("config must be a JSON object"); }

    AppCfg c{};
    std::string bad;
    auto getS=[&](const char* k, std::string& dst){
        json_object* v=nullptr;
        if(!json_object_object_get_ex(root,k,&v)) return;
        if(!json_object_is_type(v, json_type_string)) { bad = k; return; }
        dst = json_object_get_string(v);
    };

    getS("secrets_file", c.secrets_file);
    getS("key_declaration_name", c.key_decl_name);
    getS("key_env_name", c.key_env_name);

    json_object_put(root);
    if (!bad.empty()) throw ConfigError("config field '" + bad + "' must be a string");
    if (c.secrets_file.empty()) throw ConfigError("config field 'secrets_file' is empty");
    if (!is_identifier(c.key_decl_name)) throw ConfigError("config field 'key_declaration_name' is not a valid name");
    if (!c.key_env_name.empty() && !is_identifier(c.key_env_name))
        throw ConfigError("config field 'key_env_name' is not a valid name");
    return c;
}

AppCfg load_cfg(const std::string& path){
    try {
        return parse_cfg(read_file(path));
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}
