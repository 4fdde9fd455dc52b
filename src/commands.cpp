#include "commands.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "html.hpp"
#include "markdown.hpp"
#include "wrapper.hpp"
#include <filesystem>

namespace fs = std::filesystem;

std::string sibling_path(const std::string& input, const std::string& suffix){
    fs::path p(input);
    return (p.parent_path() / (p.stem().string() + suffix)).string();
}

static FormatVersion resolve_version(const CmdOptions& o){
    if (!o.format_version) return o.cfg.format_version;
    FormatVersion v = kDefaultFormat;
    if (!try_format_version(*o.format_version, v))
        throw UsageError("unsupported format version " + std::to_string(*o.format_version));
    return v;
}

static std::string read_style(const CmdOptions& o){
    if (!o.style) return "";
    if (!fs::is_regular_file(*o.style)) throw IoError("CSS file does not exist", *o.style);
    return read_file(*o.style);
}

static void check_distinct(const std::string& in, const std::string& out){
    std::error_code ec;
    if (fs::exists(out, ec) && fs::equivalent(in, out, ec))
        throw UsageError("refusing to overwrite the input file: " + in);
}

static std::string extension_of(const std::string& path){
    return to_lower_ascii(fs::path(path).extension().string());
}

std::string run_protect(CmdOptions& o){
    StringWiper wipe(o.password);
    std::string ext = extension_of(o.input);
    if (ext != ".md" && ext != ".html" && ext != ".htm")
        throw UsageError("Unsupported file type. Only .md and .html are supported.");

    enforce_password_policy(o.password, o.cfg.policy, o.allow_unsafe_password);
    if (o.allow_unsafe_password) log_info(o.log, "password strength check skipped (--allow-unsafe-password)");

    std::string out = o.output.value_or(sibling_path(o.input, ".protected.html"));
    check_distinct(o.input, out);
    log_info(o.log, "Output file: " + out);

    bool minify = o.minify.value_or(o.cfg.minify);
    std::string css = read_style(o);
    std::string html;
    if (ext == ".md") {
        html = convert_markdown_to_html(read_file(o.input), css, minify);
    } else {
        html = inject_style(read_file(o.input), css);
        if (minify) html = minify_html(html);
    }

    FormatVersion v = resolve_version(o);
    std::string token = encode_token(seal_document(html, o.password, v));

    std::string page = wrap_document(token, css, o.title.value_or(o.cfg.wrapper_title));
    if (minify) page = minify_html(page);
    write_file(out, page);
    log_info(o.log, "Protected document written (format v" + std::to_string(format_number(v)) + "): " + out);
    return out;
}

std::string run_convert(CmdOptions& o){
    if (!fs::is_regular_file(o.input)) throw IoError("Input file does not exist", o.input);
    std::string out = o.output.value_or(fs::path(o.input).replace_extension(".html").string());
    check_distinct(o.input, out);

    std::string css = read_style(o);
    std::string html = convert_markdown_to_html(read_file(o.input), css, o.minify.value_or(o.cfg.minify));
    write_file(out, html);
    log_info(o.log, "Converted " + o.input + " to " + out);
    return out;
}

std::string run_encrypt(CmdOptions& o){
    StringWiper wipe(o.password);
    enforce_password_policy(o.password, o.cfg.policy, o.allow_unsafe_password);

    std::string out = o.output.value_or(sibling_path(o.input, "-encrypted.token"));
    check_distinct(o.input, out);

    FormatVersion v = resolve_version(o);
    std::string token = encode_token(seal_document(read_file(o.input), o.password, v));
    write_file(out, token + "\n");
    log_info(o.log, "Encryption successful: " + out);
    return out;
}

std::string run_decrypt(CmdOptions& o){
    StringWiper wipe(o.password);
    std::string content = read_file(o.input);
    std::string out = o.output.value_or(sibling_path(o.input, "-decrypted.html"));
    check_distinct(o.input, out);

    // Either a protected page or a bare token file.
    std::optional<std::string> embedded = extract_token(content);
    std::string plain = open_token(embedded ? *embedded : content, o.password);
    write_file(out, plain);
    log_info(o.log, "Decryption successful: " + out);
    return out;
}

int exit_code_for(const std::exception& e){
    if (dynamic_cast<const UsageError*>(&e)) return 1;
    if (dynamic_cast<const WeakPasswordError*>(&e)) return 2;
    if (dynamic_cast<const IoError*>(&e)) return 3;
    if (dynamic_cast<const MalformedTokenError*>(&e)) return 4;
    if (dynamic_cast<const AuthFailureError*>(&e)) return 5;
    if (dynamic_cast<const CryptoError*>(&e)) return 6;
    return 1;
}
