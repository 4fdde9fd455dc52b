#pragma once
#include <string>
#include "format.hpp"
#include "password_policy.hpp"

struct AppCfg {
    PasswordPolicy policy;
    FormatVersion format_version = kDefaultFormat;
    bool minify = true;
    std::string wrapper_title = "Protected document";
};

// Flat JSON object; missing keys keep their defaults, unknown keys are
// ignored. Throws IoError or UsageError.
AppCfg load_cfg(const std::string& path);
AppCfg parse_cfg(const std::string& json_text, const std::string& origin = "config");
