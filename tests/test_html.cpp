#include <gtest/gtest.h>
#include "html.hpp"

TEST(InjectStyle, BeforeClosingHeadAnyCase){
    EXPECT_EQ(inject_style("<html><HEAD><title>t</title></HEAD><body></body></html>", "p{}"),
              "<html><HEAD><title>t</title><style>p{}</style></HEAD><body></body></html>");
}

TEST(InjectStyle, PrependsWithoutHead){
    EXPECT_EQ(inject_style("<p>x</p>", "p{}"), "<style>p{}</style><p>x</p>");
}

TEST(InjectStyle, EmptyCssIsNoop){
    EXPECT_EQ(inject_style("<p>x</p>", ""), "<p>x</p>");
}

TEST(FindCi, IgnoresAsciiCase){
    EXPECT_EQ(find_ci("abc</HeAd>", "</head>"), 3u);
    EXPECT_EQ(find_ci("abc", "x"), std::string::npos);
}

TEST(FindCi, HonoursStartAndLongNeedles){
    EXPECT_EQ(find_ci("<PRE>a</Pre><pre>b</PRE>", "</pre", 7), 18u);
    EXPECT_EQ(find_ci("<PRE>a</Pre>", "</pre", 7), std::string::npos);
    EXPECT_EQ(find_ci("ab", "abc"), std::string::npos);
    EXPECT_EQ(find_ci("ab", "", 2), 2u);
}

TEST(Minify, CollapsesWhitespaceAndDropsComments){
    std::string in = "<p>  Hello   <b>world</b>  </p>\n<!-- note -->\n<div> x </div>";
    EXPECT_EQ(minify_html(in), "<p>Hello <b>world</b></p><div>x</div>");
}

TEST(Minify, KeepsSpaceBetweenInlineElements){
    EXPECT_EQ(minify_html("<b>a</b> <i>b</i>"), "<b>a</b> <i>b</i>");
}

TEST(Minify, PreservesRawElements){
    EXPECT_EQ(minify_html("<div>\n<pre>  x\n   y  </pre>\n</div>"), "<div><pre>  x\n   y  </pre></div>");
    EXPECT_EQ(minify_html("<script>\nvar a = \"  <!-- -->  \";\n</script>"),
              "<script>\nvar a = \"  <!-- -->  \";\n</script>");
    EXPECT_EQ(minify_html("<textarea>  a  </textarea>"), "<textarea>  a  </textarea>");
}

TEST(Minify, ManyRawElements){
    std::string in, want;
    for (int i=0;i<3000;++i) {
        in += "<div>\n  <PRE>  x  </PRE>\n  <p> t </p>\n</div>\n";
        want += "<div><PRE>  x  </PRE><p>t</p></div>";
    }
    EXPECT_EQ(minify_html(in), want);
}

TEST(Minify, AttributeWithGreaterThan){
    EXPECT_EQ(minify_html("<div title=\"a > b\">\n  t\n</div>"), "<div title=\"a > b\">t</div>");
}

TEST(Minify, Doctype){
    EXPECT_EQ(minify_html("<!DOCTYPE html>\n<html>\n<head>\n</head>\n</html>\n"),
              "<!DOCTYPE html><html><head></head></html>");
}
