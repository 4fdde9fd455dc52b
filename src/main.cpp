#include <cstdio>
#include <string>
#include "commands.hpp"
#include "errors.hpp"

static const char* kUsage =
"pagelock " PAGELOCK_VERSION "\n"
"Password-protect a static HTML or Markdown document.\n"
"\n"
"USAGE:\n"
"  pagelock protect -i <in.md|in.html> -p <password> [-o <out>] [--style <css>]\n"
"                   [--allow-unsafe-password] [--minify true|false] [--title <text>]\n"
"  pagelock convert -i <in.md> [-o <out>] [--style <css>] [--minify true|false]\n"
"  pagelock encrypt -i <in.html> -p <password> [-o <out>] [--allow-unsafe-password]\n"
"  pagelock decrypt -i <token-or-protected.html> -p <password> [-o <out>]\n"
"\n"
"COMMON OPTIONS:\n"
"  --config <file.json>    settings file (password policy, format, minify, title)\n"
"  --format-version <n>    token format for new documents (1 or 2, default 2)\n"
"  -q, --quiet             only report errors\n"
"  -h, --help              show this text\n"
"  -v, --version           print the version\n";

static bool parse_bool(const std::string& s){
    if (s=="true" || s=="1") return true;
    if (s=="false" || s=="0") return false;
    throw UsageError("expected true, false, 1 or 0, got '" + s + "'");
}

static int parse_int(const std::string& s){
    if (s.empty() || s.size() > 6 || s.find_first_not_of("0123456789") != std::string::npos)
        throw UsageError("expected a number, got '" + s + "'");
    return std::stoi(s);
}

static int run(int argc, char** argv){
    if (argc < 2) { fputs(kUsage, stderr); return 1; }
    std::string cmd = argv[1];
    if (cmd=="-h" || cmd=="--help") { fputs(kUsage, stdout); return 0; }
    if (cmd=="-v" || cmd=="--version") { printf("pagelock %s\n", PAGELOCK_VERSION); return 0; }
    if (cmd!="protect" && cmd!="convert" && cmd!="encrypt" && cmd!="decrypt")
        throw UsageError("unknown command '" + cmd + "' (try --help)");

    CmdOptions o;
    std::optional<std::string> cfg_path;
    bool have_password = false;

    for (int i=2;i<argc;++i){
        std::string a = argv[i];
        auto value = [&]()->std::string{
            if (i+1 >= argc) throw UsageError("missing value for " + a);
            return argv[++i];
        };
        if (a=="-i" || a=="--input") o.input = value();
        else if (a=="-o" || a=="--output") o.output = value();
        else if (a=="-p" || a=="--password") { o.password = value(); have_password = true; }
        else if (a=="--style") o.style = value();
        else if (a=="--title") o.title = value();
        else if (a=="--config") cfg_path = value();
        else if (a=="--format-version") o.format_version = parse_int(value());
        else if (a=="--allow-unsafe-password") o.allow_unsafe_password = true;
        else if (a=="-q" || a=="--quiet") o.log.quiet = true;
        else if (a=="--minify") {
            // bare --minify means true
            if (i+1 < argc && argv[i+1][0] != '-') o.minify = parse_bool(argv[++i]);
            else o.minify = true;
        }
        else if (a=="-h" || a=="--help") { fputs(kUsage, stdout); return 0; }
        else throw UsageError("unknown option '" + a + "' for " + cmd);
    }

    if (o.input.empty()) throw UsageError(cmd + ": -i/--input is required");
    bool needs_password = (cmd != "convert");
    if (needs_password && !have_password) throw UsageError(cmd + ": -p/--password is required");
    if (!needs_password && have_password) throw UsageError("convert does not take a password");
    if (cfg_path) o.cfg = load_cfg(*cfg_path);

    std::string written;
    if (cmd=="protect") written = run_protect(o);
    else if (cmd=="convert") written = run_convert(o);
    else if (cmd=="encrypt") written = run_encrypt(o);
    else written = run_decrypt(o);

    if (!o.log.quiet) printf("%s\n", written.c_str());
    return 0;
}

int main(int argc, char** argv){
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        log_error(e.what());
        return exit_code_for(e);
    }
}
