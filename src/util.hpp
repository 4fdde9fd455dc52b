#pragma once
#include <string>
#include <fstream>
#include <sstream>
#include <cstdio>
#include <ctime>
#include "errors.hpp"

inline std::string read_file(const std::string& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw IoError("cannot open", p);
    std::ostringstream ss; ss << f.rdbuf();
    if (f.bad()) throw IoError("cannot read", p);
    return ss.str();
}

inline void write_file(const std::string& p, const std::string& s) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw IoError("cannot write", p);
    f << s;
    f.flush();
    if (!f) throw IoError("cannot write", p);
}

inline std::string to_lower_ascii(std::string s){
    for (char& c: s) if (c>='A' && c<='Z') c = (char)(c - 'A' + 'a');
    return s;
}

inline std::string escape_html(const std::string& s){
    std::string o; o.reserve(s.size()+8);
    for (char c: s){
        switch(c){
            case '&': o += "&amp;"; break;
            case '<': o += "&lt;"; break;
            case '>': o += "&gt;"; break;
            case '\"': o += "&quot;"; break;
            case '\'': o += "&#39;"; break;
            default: o += c;
        }
    }
    return o;
}

// Safe inside a "..." or '...' literal that itself sits in a <script> element.
inline std::string escape_js_string(const std::string& s){
    std::string o; o.reserve(s.size()+8);
    for (size_t i=0;i<s.size();++i){
        unsigned char c = (unsigned char)s[i];
        switch(c){
            case '\"': o += "\\\""; break;
            case '\'': o += "\\'"; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            case '<': o += "\\u003c"; break;
            case '>': o += "\\u003e"; break;
            case '&': o += "\\u0026"; break;
            default:
                if (c < 0x20) { char buf[7]; snprintf(buf,sizeof(buf),"\\u%04x", c); o += buf; }
                // U+2028 / U+2029 end a line in older JS parsers
                else if (c==0xE2 && i+2<s.size() && (unsigned char)s[i+1]==0x80 &&
                         ((unsigned char)s[i+2]==0xA8 || (unsigned char)s[i+2]==0xA9)) {
                    o += ((unsigned char)s[i+2]==0xA8) ? "\\u2028" : "\\u2029";
                    i += 2;
                }
                else o += (char)c;
        }
    }
    return o;
}

// Logging. Never pass passwords, keys or document text here.
struct LogSettings { bool quiet = false; };

inline std::string log_timestamp(){
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return buf;
}

inline void log_info(const LogSettings& ls, const std::string& msg){
    if (ls.quiet) return;
    fprintf(stderr, "%s - INFO - %s\n", log_timestamp().c_str(), msg.c_str());
}

inline void log_error(const std::string& msg){
    fprintf(stderr, "%s - ERROR - %s\n", log_timestamp().c_str(), msg.c_str());
}
