#include <gtest/gtest.h>
#include "crypto.hpp"
#include "errors.hpp"
#include "html.hpp"
#include "wrapper.hpp"

static const char* kToken = "1.AAECAwQFBgcICQoLDA0ODw==.EBESExQVFhcYGRob.JCs0Bx1lgmSEFF1IY0jO0DTJqf58BInx1t7o2Cs=";

static bool contains(const std::string& hay, const std::string& needle){
    return hay.find(needle) != std::string::npos;
}

TEST(Wrapper, FillsEveryPlaceholder){
    std::string page = wrap_document(kToken, "body { color: red; }", "Team notes");
    EXPECT_FALSE(contains(page, "{{"));
    EXPECT_TRUE(contains(page, "<title>Team notes</title>"));
    EXPECT_TRUE(contains(page, "<h1>Team notes</h1>"));
    EXPECT_TRUE(contains(page, "<style>\nbody { color: red; }\n</style>"));
    EXPECT_TRUE(contains(page, std::string("var PAGELOCK_PAYLOAD = \"") + kToken + "\";"));
    EXPECT_TRUE(contains(page, "<script id=\"pagelock-engine\">"));
}

TEST(Wrapper, NoStyleBlockWithoutCss){
    std::string page = wrap_document(kToken, "", "t");
    size_t first = page.find("<style>");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(page.find("<style>", first + 1), std::string::npos);
}

TEST(Wrapper, TitleIsHtmlEscaped){
    std::string page = wrap_document(kToken, "", "Plan <A> & \"B\"");
    EXPECT_TRUE(contains(page, "<title>Plan &lt;A&gt; &amp; &quot;B&quot;</title>"));
    EXPECT_FALSE(contains(page, "<A>"));
}

TEST(Wrapper, SubstitutedTextIsNotRescanned){
    std::string page = wrap_document(kToken, "", "{{PAYLOAD}}");
    EXPECT_TRUE(contains(page, "<title>{{PAYLOAD}}</title>"));
    EXPECT_EQ(extract_token(page).value_or(""), kToken);
}

TEST(Wrapper, CssCannotCloseStyleElement){
    std::string page = wrap_document(kToken, "a{}</style><script>alert(1)</script>", "t");
    EXPECT_FALSE(contains(page, "</style><script>alert"));
    EXPECT_TRUE(contains(page, "a{}<\\/style><script>alert(1)<\\/script>"));
}

TEST(Wrapper, RejectsTokenOutsideAlphabet){
    EXPECT_THROW(wrap_document("", "", "t"), UsageError);
    EXPECT_THROW(wrap_document("1.AA\"+alert(1)+\"", "", "t"), UsageError);
    EXPECT_THROW(wrap_document("1.AA</script>", "", "t"), UsageError);
}

TEST(Wrapper, ExtractTokenRoundTrip){
    std::string page = wrap_document(kToken, "p{margin:0}", "t");
    EXPECT_EQ(extract_token(page).value_or(""), kToken);
    EXPECT_EQ(extract_token(minify_html(page)).value_or(""), kToken);
    EXPECT_FALSE(extract_token("<html><body>plain</body></html>").has_value());
}

TEST(Wrapper, ArtifactCarriesNoPlaintext){
    Payload p = seal_document("TOP SECRET agenda", "Tr0ub4dor&3", FormatVersion::V1);
    std::string page = wrap_document(encode_token(p), "", "Protected document");
    EXPECT_FALSE(contains(page, "TOP SECRET"));
    EXPECT_FALSE(contains(page, "Tr0ub4dor"));
}
