#include <gtest/gtest.h>
#include "crypto.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <vector>

// Tokens produced by WebCrypto in Node (tests/js/generate_fixtures.mjs).
struct Fixture {
    int version;
    std::string password, plaintext, token;
};

static std::vector<std::string> split_tabs(const std::string& line){
    std::vector<std::string> f;
    size_t start = 0;
    for (;;) {
        size_t tab = line.find('\t', start);
        f.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
        if (tab == std::string::npos) break;
        start = tab + 1;
    }
    return f;
}

static std::vector<Fixture> load_fixtures(){
    std::string text = read_file(std::string(PAGELOCK_TEST_DATA_DIR) + "/conformance_tokens.txt");
    std::vector<Fixture> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        start = (nl == std::string::npos) ? text.size() : nl + 1;
        if (line.empty()) continue;
        std::vector<std::string> f = split_tabs(line);
        if (f.size() != 4) continue;
        out.push_back(Fixture{std::stoi(f[0]), f[1], f[2], f[3]});
    }
    return out;
}

TEST(Conformance, OpensBrowserProducedTokens){
    std::vector<Fixture> fx = load_fixtures();
    ASSERT_EQ(fx.size(), 4u);
    for (const Fixture& f: fx) {
        Payload p = decode_token(f.token);
        EXPECT_EQ(format_number(p.version), f.version);
        EXPECT_EQ(open_token(f.token, f.password), f.plaintext) << f.token;
        EXPECT_THROW(open_token(f.token, "wrong"), AuthFailureError);
    }
}

TEST(Conformance, SealsIdenticallyToBrowser){
    for (const Fixture& f: load_fixtures()) {
        Payload in = decode_token(f.token);
        Payload out = seal_document_with(f.plaintext, f.password, in.version, in.salt, in.nonce);
        EXPECT_EQ(encode_token(out), f.token);
    }
}
