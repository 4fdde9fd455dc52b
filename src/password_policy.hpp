#pragma once
#include <string>
#include <vector>

struct PasswordPolicy {
    size_t min_length = 8;   // Unicode code points
    bool require_lowercase = true;
    bool require_uppercase = true;
    bool require_digit = true;
    bool require_special = true;
    std::string special_characters = "!@#$%^&*()-_=+[]{}|;:'\",.<>?/";
};

struct PolicyResult {
    bool ok = true;
    std::vector<std::string> reasons;
};

// Pure check. allow_unsafe accepts anything and reports nothing.
PolicyResult validate_password(const std::string& password,
                               const PasswordPolicy& policy,
                               bool allow_unsafe = false);

// Throws WeakPasswordError with every failed rule.
void enforce_password_policy(const std::string& password,
                             const PasswordPolicy& policy,
                             bool allow_unsafe);
