#pragma once
#include <string>

// Inserts <style>css</style> before the first </head>; prepends it when the
// document has no head. Empty css leaves the document unchanged.
std::string inject_style(const std::string& html, const std::string& css);

// Drops comments and formatting whitespace. Contents of pre, textarea,
// script and style are copied verbatim.
std::string minify_html(const std::string& html);

// Case-insensitive find of an ASCII needle.
size_t find_ci(const std::string& hay, const std::string& needle, size_t from = 0);
