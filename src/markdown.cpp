#include "markdown.hpp"
#include "errors.hpp"
#include "html.hpp"

extern "C" {
#include <md4c-html.h>
}

// CommonMark plus pipe tables. Entities are kept as written, raw HTML passes through.
static const unsigned kParserFlags = MD_FLAG_TABLES;
static const unsigned kRendererFlags = MD_HTML_FLAG_VERBATIM_ENTITIES;

static void append_output(const MD_CHAR* text, MD_SIZE size, void* userdata){
    static_cast<std::string*>(userdata)->append(text, size);
}

std::string render_markdown(const std::string& markdown){
    std::string out;
    out.reserve(markdown.size() + markdown.size()/4);
    int rc = md_html(markdown.data(), (MD_SIZE)markdown.size(), append_output, &out,
                     kParserFlags, kRendererFlags);
    if (rc != 0) throw PagelockError("markdown rendering failed");
    return out;
}

static std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while (b < e && (s[b]==' ' || s[b]=='\t' || s[b]=='\n' || s[b]=='\r')) ++b;
    while (e > b && (s[e-1]==' ' || s[e-1]=='\t' || s[e-1]=='\n' || s[e-1]=='\r')) --e;
    return s.substr(b, e-b);
}

static std::string strip_tags(const std::string& s){
    std::string o;
    bool in_tag = false;
    for (char c: s) {
        if (c=='<') in_tag = true;
        else if (c=='>' && in_tag) in_tag = false;
        else if (!in_tag) o += c;
    }
    return o;
}

// Text of the first <h1>, already escaped by the renderer.
static std::string first_heading(const std::string& body){
    size_t h1 = body.find("<h1>");
    if (h1 == std::string::npos) return "";
    size_t end = body.find("</h1>", h1);
    size_t len = (end == std::string::npos) ? std::string::npos : end - h1 - 4;
    return trim(strip_tags(body.substr(h1 + 4, len)));
}

std::string convert_markdown_to_html(const std::string& markdown, const std::string& css, bool minify){
    std::string body = trim(render_markdown(markdown));

    std::string title = first_heading(body);
    if (title.empty()) title = "Markdown Conversion";

    std::string style_tag = css.empty() ? "" : "<style>" + css + "</style>\n";
    std::string doc =
        "<!DOCTYPE html>\n"
        "<html lang=\"en\">\n"
        "<head>\n"
        "  <meta charset=\"utf-8\">\n"
        "  <meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
        "  <title>" + title + "</title>\n"
        "  " + style_tag +
        "</head>\n"
        "<body>\n" +
        body + "\n"
        "</body>\n"
        "</html>\n";
    return minify ? minify_html(doc) : doc;
}
