#include "payload.hpp"
#include "base64.hpp"
#include "errors.hpp"
#include <vector>

std::string encode_token(const Payload& p){
    const FormatParams& fp = format_params(p.version);
    if (p.salt.size() != fp.salt_len || p.nonce.size() != fp.nonce_len || p.ciphertext.size() < fp.tag_len)
        throw UsageError("payload fields do not match format version " + std::to_string(format_number(p.version)));

    std::string t = std::to_string(format_number(p.version));
    t += '.'; t += base64_encode(p.salt);
    t += '.'; t += base64_encode(p.nonce);
    t += '.'; t += base64_encode(p.ciphertext);
    return t;
}

static bool is_space(char c){
    return c==' ' || c=='\t' || c=='\n' || c=='\r' || c=='\f' || c=='\v';
}

static std::vector<std::string> split_dots(const std::string& s){
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t dot = s.find('.', start);
        if (dot == std::string::npos) { parts.push_back(s.substr(start)); break; }
        parts.push_back(s.substr(start, dot-start));
        start = dot + 1;
    }
    return parts;
}

bool try_decode_token(const std::string& token, Payload& out){
    size_t b = 0, e = token.size();
    while (b < e && is_space(token[b])) ++b;
    while (e > b && is_space(token[e-1])) --e;
    std::string t = token.substr(b, e-b);

    std::vector<std::string> f = split_dots(t);
    if (f.size() != 4) return false;

    const std::string& ver = f[0];
    if (ver.empty() || ver.size() > 3) return false;
    int n = 0;
    for (char c: ver) {
        if (c<'0' || c>'9') return false;
        n = n*10 + (c-'0');
    }
    FormatVersion v = kDefaultFormat;
    if (!try_format_version(n, v)) return false;
    const FormatParams& fp = format_params(v);

    Payload p;
    p.version = v;
    if (!try_base64_decode(f[1], p.salt) || p.salt.size() != fp.salt_len) return false;
    if (!try_base64_decode(f[2], p.nonce) || p.nonce.size() != fp.nonce_len) return false;
    if (!try_base64_decode(f[3], p.ciphertext) || p.ciphertext.size() < fp.tag_len) return false;

    out = std::move(p);
    return true;
}

Payload decode_token(const std::string& token){
    Payload p;
    if (!try_decode_token(token, p)) throw MalformedTokenError("malformed token");
    return p;
}

bool is_token_char(char c){
    return (c>='A' && c<='Z') || (c>='a' && c<='z') || (c>='0' && c<='9') ||
           c=='+' || c=='/' || c=='=' || c=='.';
}
