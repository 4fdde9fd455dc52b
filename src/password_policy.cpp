#include "password_policy.hpp"
#include "errors.hpp"
#include <algorithm>

// Counts UTF-8 lead bytes; continuation bytes (10xxxxxx) are skipped.
static size_t code_point_count(const std::string& s){
    size_t n = 0;
    for (unsigned char c: s) if ((c & 0xC0) != 0x80) ++n;
    return n;
}

PolicyResult validate_password(const std::string& password,
                               const PasswordPolicy& policy,
                               bool allow_unsafe){
    PolicyResult r;
    if (allow_unsafe) return r;

    auto has = [&](auto pred){ return std::any_of(password.begin(), password.end(), pred); };

    if (code_point_count(password) < policy.min_length)
        r.reasons.push_back("must be at least " + std::to_string(policy.min_length) + " characters long");
    if (policy.require_lowercase && !has([](char c){ return c>='a' && c<='z'; }))
        r.reasons.push_back("must contain at least one lowercase letter");
    if (policy.require_uppercase && !has([](char c){ return c>='A' && c<='Z'; }))
        r.reasons.push_back("must contain at least one uppercase letter");
    if (policy.require_digit && !has([](char c){ return c>='0' && c<='9'; }))
        r.reasons.push_back("must contain at least one digit");
    if (policy.require_special &&
        password.find_first_of(policy.special_characters) == std::string::npos)
        r.reasons.push_back("must contain at least one special character");

    r.ok = r.reasons.empty();
    return r;
}

void enforce_password_policy(const std::string& password,
                             const PasswordPolicy& policy,
                             bool allow_unsafe){
    PolicyResult r = validate_password(password, policy, allow_unsafe);
    if (!r.ok) throw WeakPasswordError(r.reasons);
}
