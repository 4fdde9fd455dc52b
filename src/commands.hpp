#pragma once
#include <exception>
#include <optional>
#include <string>
#include "config.hpp"
#include "util.hpp"

struct CmdOptions {
    std::string input;
    std::optional<std::string> output;
    std::string password;
    std::optional<std::string> style;
    std::optional<std::string> title;
    std::optional<bool> minify;
    std::optional<int> format_version;
    bool allow_unsafe_password = false;
    AppCfg cfg;
    LogSettings log;
};

// Each returns the path it wrote. Errors are thrown (errors.hpp).
std::string run_protect(CmdOptions& o);
std::string run_convert(CmdOptions& o);
std::string run_encrypt(CmdOptions& o);
std::string run_decrypt(CmdOptions& o);

// <input dir>/<stem><suffix>
std::string sibling_path(const std::string& input, const std::string& suffix);

// Exit status for an exception escaping a command.
int exit_code_for(const std::exception& e);
