#include "format.hpp"
#include "errors.hpp"

static const FormatParams kV1{FormatVersion::V1, "SHA256", 100000, 16, 12, 32, 16, false};
static const FormatParams kV2{FormatVersion::V2, "SHA256", 600000, 16, 12, 32, 16, true};

const FormatParams& format_params(FormatVersion v){
    switch (v) {
        case FormatVersion::V1: return kV1;
        case FormatVersion::V2: return kV2;
    }
    throw UsageError("unknown format version " + std::to_string((int)v));
}

bool try_format_version(int n, FormatVersion& out){
    switch (n) {
        case 1: out = FormatVersion::V1; return true;
        case 2: out = FormatVersion::V2; return true;
        default: return false;
    }
}

int format_number(FormatVersion v){
    return static_cast<int>(v);
}

Bytes format_aad(FormatVersion v){
    if (!format_params(v).bind_version_aad) return Bytes();
    return Bytes{static_cast<unsigned char>(v)};
}
