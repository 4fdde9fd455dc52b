#include "wrapper.hpp"
#include "decrypt_template.hpp"
#include "errors.hpp"
#include "payload.hpp"
#include "util.hpp"
#include <cstring>

static const char kPayloadPrefix[] = "var PAGELOCK_PAYLOAD = \"";

// A "</" inside CSS would let the text close the <style> element early.
static std::string neutralize_style(const std::string& css){
    std::string o; o.reserve(css.size());
    for (size_t i=0;i<css.size();++i){
        if (css[i]=='<' && i+1<css.size() && css[i+1]=='/') { o += "<\\/"; ++i; }
        else o += css[i];
    }
    return o;
}

std::string wrap_document(const std::string& token, const std::string& css, const std::string& title){
    if (token.empty()) throw UsageError("empty token");
    for (char c: token)
        if (!is_token_char(c)) throw UsageError("token contains characters outside the token alphabet");

    std::string style_block;
    if (!css.empty()) style_block = "<style>\n" + neutralize_style(css) + "\n</style>";

    struct Slot { const char* name; std::string value; };
    const Slot slots[] = {
        {"{{TITLE}}", escape_html(title)},
        {"{{STYLE_BLOCK}}", style_block},
        {"{{PAYLOAD}}", escape_js_string(token)},
    };

    // Single pass so substituted text is never scanned for placeholders again.
    std::string out;
    const char* p = kDecryptTemplate;
    out.reserve(std::strlen(p) + token.size() + css.size() + 2*title.size());
    while (*p) {
        bool hit = false;
        if (p[0]=='{' && p[1]=='{') {
            for (const Slot& s: slots) {
                size_t n = std::strlen(s.name);
                if (std::strncmp(p, s.name, n) == 0) { out += s.value; p += n; hit = true; break; }
            }
        }
        if (!hit) out += *p++;
    }
    return out;
}

std::optional<std::string> extract_token(const std::string& html){
    size_t pos = html.find(kPayloadPrefix);
    if (pos == std::string::npos) return std::nullopt;
    pos += sizeof(kPayloadPrefix) - 1;
    size_t end = html.find('"', pos);
    if (end == std::string::npos) return std::nullopt;
    return html.substr(pos, end-pos);
}
