#include <gtest/gtest.h>

#include "../include/dfakit/parser.hpp"

#include <stdexcept>

namespace dfakit::parser {
namespace {

const std::filesystem::path kDataDir{DFAKIT_TEST_DATA_DIR};

std::string Model(std::string_view cells) {
  return "<mxGraphModel><root><mxCell id=\"0\"/><mxCell id=\"1\" parent=\"0\"/>" +
         std::string{cells} + "</root></mxGraphModel>";
}

TEST(ParserTest, Base64Decode) {
  EXPECT_EQ(base64_decode("aGVsbG8="), "hello");
  EXPECT_EQ(base64_decode("ZGZh\na2l0"), "dfakit");
  EXPECT_EQ(base64_decode(""), "");

  auto bad = base64_decode("aGV*bG8=");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), ParseError::Base64DecodeError);
}

TEST(ParserTest, UrlDecode) {
  EXPECT_EQ(url_decode("x%40x.x"), "x@x.x");
  EXPECT_EQ(url_decode("%3CmxCell%20id%3D%220%22%2F%3E"), "<mxCell id=\"0\"/>");
  EXPECT_EQ(url_decode("plain"), "plain");
}

TEST(ParserTest, InflateRawDeflate) {
  auto inflated = base64_decode("S0lLBAA=").and_then(inflate);
  ASSERT_TRUE(inflated.has_value());
  EXPECT_EQ(inflated.value(), "dfa");
}

TEST(ParserTest, InflateRejectsGarbage) {
  auto inflated = inflate("definitely not deflate data");
  ASSERT_FALSE(inflated.has_value());
  EXPECT_EQ(inflated.error(), ParseError::InflationError);
}

TEST(ParserTest, DecodePassesPlainModelThrough) {
  const auto model = Model("");
  EXPECT_EQ(decode_drawio("  " + model + "\n"), model);
}

TEST(ParserTest, TokensFromStatesAndArrows) {
  auto tokens = drawio_to_tokens(Model(
      R"(<mxCell id="a" value="$STATE=start;$INITIAL" style="ellipse;html=1;" vertex="1" parent="1"/>)"
      R"(<mxCell id="b" value="&lt;i&gt;done&lt;/i&gt;;$TERMINAL" style="ellipse;html=1;" vertex="1" parent="1"/>)"
      R"(<mxCell id="t" value="comment" style="text;html=1;" vertex="1" parent="1"/>)"
      R"(<mxCell id="e" value="x, y" style="edgeStyle=orthogonalEdgeStyle;html=1;" edge="1" parent="1" source="a" target="b"/>)"
      R"(<mxCell id="f" value="," style="endArrow=classic;html=1;" edge="1" parent="1" source="b" target="b"/>)"));
  ASSERT_TRUE(tokens.has_value()) << to_string(tokens.error());

  auto& [states, arrows] = tokens.value();
  EXPECT_EQ(states, (States_t{
      DiagramState{"a", "start", true, false},
      DiagramState{"b", "done", false, true},
  }));
  EXPECT_EQ(arrows, (Arrows_t{
      DiagramArrow{"e", "a", "b", {'x', 'y'}},
      DiagramArrow{"f", "b", "b", {','}},
  }));
}

TEST(ParserTest, DetachedEdgeLabel) {
  auto tokens = drawio_to_tokens(Model(
      R"(<mxCell id="a" value="a;$INITIAL" style="ellipse;" vertex="1" parent="1"/>)"
      R"(<mxCell id="e" value="" style="edgeStyle=orthogonalEdgeStyle;" edge="1" parent="1" source="a" target="a"/>)"
      R"(<mxCell id="l" value="0" style="edgeLabel;html=1;" vertex="1" connectable="0" parent="e"/>)"));
  ASSERT_TRUE(tokens.has_value()) << to_string(tokens.error());

  auto& [states, arrows] = tokens.value();
  EXPECT_EQ(states.size(), 1u);
  ASSERT_EQ(arrows.size(), 1u);
  EXPECT_EQ(arrows[0].m_symbols, (std::vector<char>{'0'}));
}

TEST(ParserTest, MalformedCells) {
  struct Case {
    std::string cells;
    ParseError expected;
  };
  const std::vector<Case> cases = {
      {R"(<mxCell id="a" value="$INITIAL" style="ellipse;" vertex="1" parent="1"/>)",
       ParseError::UnnamedState},
      {R"(<mxCell id="a" value="a" style="ellipse;" vertex="1" parent="1"/>)"
       R"(<mxCell id="e" value="ab" style="edgeStyle=orthogonalEdgeStyle;" edge="1" parent="1" source="a" target="a"/>)",
       ParseError::InvalidArrowLabel},
      {R"(<mxCell id="a" value="a" style="ellipse;" vertex="1" parent="1"/>)"
       R"(<mxCell id="e" style="edgeStyle=orthogonalEdgeStyle;" edge="1" parent="1" source="a" target="a"/>)",
       ParseError::MissingArrowLabel},
      {R"(<mxCell id="a" value="a" style="ellipse;" vertex="1" parent="1"/>)"
       R"(<mxCell id="e" value="x" style="edgeStyle=orthogonalEdgeStyle;" edge="1" parent="1" source="a"/>)",
       ParseError::MissingTargetArrow},
      {R"(<mxCell id="a" value="a" style="ellipse;" vertex="1" parent="1"/>)"
       R"(<mxCell id="e" value="x" style="edgeStyle=orthogonalEdgeStyle;" edge="1" parent="1" target="a"/>)",
       ParseError::MissingSourceArrow},
  };

  for (const auto& c : cases) {
    auto tokens = drawio_to_tokens(Model(c.cells));
    ASSERT_FALSE(tokens.has_value()) << c.cells;
    EXPECT_EQ(tokens.error(), c.expected) << c.cells;
  }
}

TEST(ParserTest, NotAModel) {
  auto tokens = drawio_to_tokens("<mxGraphModel><nothing/></mxGraphModel>");
  ASSERT_FALSE(tokens.has_value());
  EXPECT_EQ(tokens.error(), ParseError::InvalidDecodedDrawioFile);

  auto broken = drawio_to_tokens("<mxGraphModel><root>");
  ASSERT_FALSE(broken.has_value());
  EXPECT_EQ(broken.error(), ParseError::InvalidDecodedDrawioFile);
}

TEST(ParserTest, ReadCompressedDiagram) {
  auto tokens = read_diagram(kDataDir / "ab_then_a.drawio");
  ASSERT_TRUE(tokens.has_value()) << to_string(tokens.error());

  auto& [states, arrows] = tokens.value();
  ASSERT_EQ(states.size(), 3u);
  EXPECT_EQ(states[0], (DiagramState{"st1", "s1", true, false}));
  EXPECT_EQ(states[2], (DiagramState{"st3", "s3", false, true}));
  ASSERT_EQ(arrows.size(), 3u);
  EXPECT_EQ(arrows[1], (DiagramArrow{"e2", "st2", "st3", {'b'}}));
}

TEST(ParserTest, ReadUncompressedDiagram) {
  auto tokens = read_diagram(kDataDir / "parity.drawio");
  ASSERT_TRUE(tokens.has_value()) << to_string(tokens.error());

  auto& [states, arrows] = tokens.value();
  EXPECT_EQ(states, (States_t{
      DiagramState{"even", "even", true, true},
      DiagramState{"odd", "odd", false, false},
  }));
  EXPECT_EQ(arrows.size(), 4u);
}

TEST(ParserTest, FileErrors) {
  EXPECT_EQ(read_diagram("").error(), ParseError::EmptyPath);
  EXPECT_EQ(read_diagram(kDataDir / "does_not_exist.drawio").error(),
            ParseError::InvalidEncodedDrawioFile);
  EXPECT_THROW(HandleParseError(ParseError::UnnamedState), std::runtime_error);
}

}  // namespace
}  // namespace dfakit::parser
