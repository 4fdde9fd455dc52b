#pragma once
#include <optional>
#include <string>

// Fills the decrypt template. No cryptography happens here; the token is
// carried as-is (after a character check) into a JS string constant.
std::string wrap_document(const std::string& token, const std::string& css, const std::string& title);

// Reads the token back out of a page produced by wrap_document.
std::optional<std::string> extract_token(const std::string& artifact_html);
