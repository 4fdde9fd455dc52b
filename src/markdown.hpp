#pragma once
#include <string>

// Markdown body to HTML fragment via md4c: CommonMark with pipe tables.
// Throws PagelockError if the renderer fails.
std::string render_markdown(const std::string& markdown);

// Full document: doctype, UTF-8 meta, <title> from the first level-1
// heading (else "Markdown Conversion"), optional <style>, body.
std::string convert_markdown_to_html(const std::string& markdown, const std::string& css = "",
                                     bool minify = false);
