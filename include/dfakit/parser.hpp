#ifndef DFAKIT_PARSER_H
#define DFAKIT_PARSER_H

#include "diagram_elements.hpp"

#include <string>
#include <string_view>
#include <filesystem>

#include <tl/expected.hpp>

namespace dfakit::parser
{
    enum class ParseError
    {
        EmptyPath,
        InvalidEncodedDrawioFile,
        ExtractingDrawioString,
        URLDecodeError,
        Base64DecodeError,
        InflationError,
        InvalidDecodedDrawioFile,
        MissingSourceArrow,
        MissingTargetArrow,
        MissingArrowLabel,
        InvalidArrowLabel,
        UnnamedState
    };

    [[nodiscard]]
    auto to_string(const ParseError err) -> std::string;

    void HandleParseError(const ParseError err);

    // the contents of the <diagram> element, either the compressed string or,
    // for an uncompressed export, the <mxGraphModel> markup
    [[nodiscard]] 
    auto extract_drawio(const std::filesystem::path& path) -> tl::expected<std::string, ParseError>;

    // base64 -> raw inflate -> url decode, plain mxGraphModel markup is passed through
    [[nodiscard]]
    auto decode_drawio(std::string_view diagram) -> tl::expected<std::string, ParseError>;

    [[nodiscard]] 
    auto inflate(std::string_view str) -> tl::expected<std::string, ParseError>;

    [[nodiscard]] 
    auto base64_decode(std::string_view encoded_str) -> tl::expected<std::string, ParseError>;

    [[nodiscard]] 
    auto url_decode(std::string_view encoded_str) -> tl::expected<std::string, ParseError>;

    [[nodiscard]] 
    auto drawio_to_tokens(std::string_view drawio_xml_str) -> tl::expected<TokenTuple, ParseError>;

    // extract_drawio, decode_drawio and drawio_to_tokens in one go
    [[nodiscard]]
    auto read_diagram(const std::filesystem::path& path) -> tl::expected<TokenTuple, ParseError>;
}

#endif
