#include "html.hpp"
#include "util.hpp"
#include <set>
#include <vector>

static char lower_ascii(char c){
    return (c>='A' && c<='Z') ? (char)(c - 'A' + 'a') : c;
}

size_t find_ci(const std::string& hay, const std::string& needle, size_t from){
    if (needle.empty()) return from <= hay.size() ? from : std::string::npos;
    if (needle.size() > hay.size()) return std::string::npos;
    for (size_t i = from; i + needle.size() <= hay.size(); ++i) {
        size_t k = 0;
        while (k < needle.size() && lower_ascii(hay[i+k]) == lower_ascii(needle[k])) ++k;
        if (k == needle.size()) return i;
    }
    return std::string::npos;
}

std::string inject_style(const std::string& html, const std::string& css){
    if (css.empty()) return html;
    std::string tag = "<style>" + css + "</style>";
    size_t pos = find_ci(html, "</head>");
    if (pos == std::string::npos) return tag + html;
    return html.substr(0, pos) + tag + html.substr(pos);
}

struct HtmlPiece {
    enum Kind { Tag, Text, Raw } kind;
    std::string text;
    std::string name;   // lower-case tag name, "" for text
};

static bool is_ws(char c){ return c==' ' || c=='\t' || c=='\n' || c=='\r' || c=='\f'; }
static bool is_alpha(char c){ return (c>='a' && c<='z') || (c>='A' && c<='Z'); }

static bool tag_starts_at(const std::string& s, size_t i){
    return s[i]=='<' && i+1<s.size() && (is_alpha(s[i+1]) || s[i+1]=='/' || s[i+1]=='!');
}

static const std::set<std::string>& raw_elements(){
    static const std::set<std::string> s{"pre", "textarea", "script", "style"};
    return s;
}

static const std::set<std::string>& block_elements(){
    static const std::set<std::string> s{
        "!doctype", "html", "head", "body", "title", "meta", "link", "style", "script", "noscript",
        "main", "header", "footer", "nav", "section", "article", "aside", "div", "p", "form",
        "h1", "h2", "h3", "h4", "h5", "h6", "ul", "ol", "li", "dl", "dt", "dd", "hr", "br",
        "table", "thead", "tbody", "tfoot", "tr", "td", "th", "caption", "pre", "blockquote",
        "figure", "figcaption", "details", "summary", "textarea",
    };
    return s;
}

static std::vector<HtmlPiece> tokenize(const std::string& html){
    std::vector<HtmlPiece> out;
    size_t i = 0, n = html.size();
    while (i < n) {
        if (html.compare(i, 4, "<!--") == 0) {
            size_t end = html.find("-->", i+4);
            i = (end == std::string::npos) ? n : end + 3;
            continue;
        }
        if (tag_starts_at(html, i)) {
            size_t j = i + 1;
            char quote = 0;
            for (; j < n; ++j) {
                char c = html[j];
                if (quote) { if (c == quote) quote = 0; }
                else if (c=='"' || c=='\'') quote = c;
                else if (c=='>') break;
            }
            size_t stop = (j < n) ? j + 1 : n;
            HtmlPiece p{HtmlPiece::Tag, html.substr(i, stop-i), ""};
            size_t k = i + 1;
            bool closing = (k < n && html[k]=='/');
            if (closing) ++k;
            while (k < stop && (is_alpha(html[k]) || (html[k]>='0' && html[k]<='9') || html[k]=='!' || html[k]=='-')) {
                p.name += html[k]; ++k;
            }
            p.name = to_lower_ascii(p.name);
            out.push_back(p);
            i = stop;

            if (!closing && raw_elements().count(p.name)) {
                size_t close = find_ci(html, "</" + p.name, i);
                if (close == std::string::npos) close = n;
                if (close > i) out.push_back(HtmlPiece{HtmlPiece::Raw, html.substr(i, close-i), ""});
                i = close;
            }
            continue;
        }
        size_t j = i + 1;
        while (j < n && !tag_starts_at(html, j) && html.compare(j, 4, "<!--") != 0) ++j;
        out.push_back(HtmlPiece{HtmlPiece::Text, html.substr(i, j-i), ""});
        i = j;
    }
    return out;
}

static bool is_block_tag(const std::vector<HtmlPiece>& v, size_t k){
    return k < v.size() && v[k].kind == HtmlPiece::Tag && block_elements().count(v[k].name);
}

std::string minify_html(const std::string& html){
    std::vector<HtmlPiece> v = tokenize(html);
    std::string out;
    out.reserve(html.size());

    for (size_t k = 0; k < v.size(); ++k) {
        const HtmlPiece& p = v[k];
        if (p.kind != HtmlPiece::Text) { out += p.text; continue; }

        bool block_before = (k == 0) || is_block_tag(v, k-1);
        bool block_after = (k+1 == v.size()) || is_block_tag(v, k+1);

        std::string t;
        bool pending_space = false;
        for (char c: p.text) {
            if (is_ws(c)) { pending_space = true; continue; }
            if (pending_space && (!t.empty() || !block_before)) t += ' ';
            pending_space = false;
            t += c;
        }
        if (t.empty()) {
            // whitespace-only: keep one space between inline neighbours
            if (pending_space && !block_before && !block_after) out += ' ';
            continue;
        }
        if (pending_space && !block_after) t += ' ';
        out += t;
    }
    return out;
}
