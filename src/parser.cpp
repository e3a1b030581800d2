#include "../include/dfakit/parser.hpp"
#include "../include/dfakit/diagram_elements.hpp"
#include "../include/dfakit/utility.hpp"
#include "../include/dfakit/ranges_helpers.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <ranges>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include <zlib.h>
#include <curl/curl.h>
#include <tinyxml2.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dfakit::parser
{
    // namespaces aliases
    using namespace tinyxml2;
    namespace views = std::views;
    namespace ranges = std::ranges;

    // helper functions
    namespace helpers
    {
        // attributes are optional on mxCells, a missing one reads as empty
        static auto attribute(const XMLElement *element, const char *name) -> std::string
        {
            auto value = element->Attribute(name);
            return value != nullptr ? utility::strip_markup(value) : std::string{};
        }

        static auto split(std::string_view str, char delim) -> std::vector<std::string_view>
        {
            return str
                | views::split(delim)
                | views::transform([](auto r){ return utility::trim(std::string_view(r.begin(), r.end())); })
                | utility::to<std::vector<std::string_view>>();
        }

        // checks if a given mxCell element is a given type based on its "style",
        // either a bare `key` or a `key=value` entry
        static auto elem_has_style(const XMLElement *element, std::string_view key) -> bool
        {
            if (auto style = element->Attribute("style"); style != nullptr)
            {
                return ranges::any_of(split(style, ';'), [key](std::string_view tok) {
                    return tok == key || (tok.starts_with(key) && tok.substr(key.size()).starts_with('='));
                });
            }
            return false;
        }

        // specialisations of elem type checked lambda
        static auto is_arrow(const XMLElement *element)
        {
            auto edge = element->Attribute("edge");
            return (edge != nullptr && std::string_view{edge} == "1")
                || elem_has_style(element, "edgeStyle");
        }

        static auto is_edge_label(const XMLElement *element)
        {
            return elem_has_style(element, "edgeLabel");
        }

        static auto is_text(const XMLElement *element)
        {
            return elem_has_style(element, "text");
        }

        static auto is_state(const XMLElement *element)
        {
            return !is_arrow(element) && !is_edge_label(element) && !is_text(element);
        }
    }

    auto extract_drawio(const std::filesystem::path &path) -> tl::expected<std::string, ParseError>
    {
        if (path.empty())
        {
            return tl::unexpected<ParseError>(ParseError::EmptyPath);
        }

        XMLDocument doc;
        doc.LoadFile(path.c_str());

        if (doc.ErrorID() != XML_SUCCESS)
        {
            spdlog::debug("tinyxml2 could not load {}: {}", path.string(), doc.ErrorStr());
            return tl::unexpected<ParseError>(ParseError::InvalidEncodedDrawioFile);
        }

        XMLElement *pRootElement = doc.RootElement();
        if (pRootElement != nullptr)
        {
            auto *pDiagram = pRootElement->FirstChildElement("diagram");
            if (pDiagram != nullptr)
            {
                // uncompressed export, hand back the model markup itself
                if (auto *pModel = pDiagram->FirstChildElement("mxGraphModel"); pModel != nullptr)
                {
                    XMLPrinter printer;
                    pModel->Accept(&printer);
                    return std::string{printer.CStr()};
                }
                if (auto text = pDiagram->GetText(); text != nullptr)
                {
                    return std::string{text};
                }
            }
        }
        return tl::unexpected<ParseError>(ParseError::ExtractingDrawioString);
    }

    auto decode_drawio(std::string_view diagram) -> tl::expected<std::string, ParseError>
    {
        auto trimmed = utility::trim(diagram);
        if (trimmed.starts_with('<'))
        {
            spdlog::debug("diagram is not compressed");
            return std::string{trimmed};
        }

        return base64_decode(trimmed)
            .and_then(inflate)
            .and_then(url_decode);
    }

    auto inflate(std::string_view str) -> tl::expected<std::string, ParseError>
    {
        z_stream zs;
        memset(&zs, 0, sizeof(zs));

        // draw.io writes raw deflate data, no zlib header
        if (inflateInit2(&zs, -MAX_WBITS) != Z_OK)
            return tl::unexpected<ParseError>(ParseError::InflationError);

        zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(str.data()));
        zs.avail_in = static_cast<uInt>(str.size());

        int ret;
        std::array<char, 32768> outbuffer;
        std::string outstring;

        do
        {
            zs.next_out = reinterpret_cast<Bytef *>(outbuffer.data());
            zs.avail_out = static_cast<uInt>(outbuffer.size());
            ret = ::inflate(&zs, Z_NO_FLUSH);
            if (outstring.size() < zs.total_out)
            {
                outstring.append(outbuffer.data(), zs.total_out - outstring.size());
            }

        } while (ret == Z_OK);

        inflateEnd(&zs);
        if (ret != Z_STREAM_END)
        {
            return tl::unexpected<ParseError>(ParseError::InflationError);
        }

        return outstring;
    }

    auto base64_decode(std::string_view encoded_str) -> tl::expected<std::string, ParseError>
    {
        constexpr std::string_view alphabet =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        std::string out;
        int val = 0, valb = -8;
        for (unsigned char c : encoded_str)
        {
            if (c == '=')
                break;
            if (c == '\n' || c == '\r' || c == ' ')
                continue;

            auto pos = alphabet.find(static_cast<char>(c));
            if (pos == std::string_view::npos)
            {
                return tl::unexpected<ParseError>(ParseError::Base64DecodeError);
            }
            val = (val << 6) + static_cast<int>(pos);
            valb += 6;
            if (valb >= 0)
            {
                out.push_back(char((val >> valb) & 0xFF));
                valb -= 8;
            }
        }
        return out;
    }

    auto url_decode(std::string_view encoded_str) -> tl::expected<std::string, ParseError>
    {
        CURL *curl = curl_easy_init();
        int outlen;
        if (curl)
        {
            char *decoded = curl_easy_unescape(curl, encoded_str.data(), static_cast<int>(encoded_str.length()), &outlen);
            if (decoded)
            {
                std::string decoded_str(decoded, outlen);
                curl_free(decoded);
                curl_easy_cleanup(curl);
                return decoded_str;
            }
            curl_easy_cleanup(curl);
        }
        return tl::unexpected<ParseError>(ParseError::URLDecodeError);
    }

    static auto states_from_xml_elements(const std::vector<XMLElement *> &elements)
        -> tl::expected<std::vector<DiagramState>, ParseError>
    {
        auto to_state = [](XMLElement *el) -> tl::expected<DiagramState, ParseError>
        {
            using namespace std::literals;
            /*
            Valid expressions are
                (1) $STATE=xyz
                (2) xyz
                (3) $INITIAL
                (4) $TERMINAL
            Which are ; delimited, in any order
            */
            const std::string value{helpers::attribute(el, "value")};
            auto toks = helpers::split(value, ';');

            std::string name;
            for (auto tok : toks)
            {
                if (tok.starts_with("$STATE="sv))
                {
                    tok.remove_prefix("$STATE="sv.size());
                    name = utility::trim(tok);
                }
                else if (!tok.empty() && !tok.starts_with('$') && name.empty())
                {
                    name = tok;
                }
            }

            std::string id{helpers::attribute(el, "id")};
            if (name.empty())
            {
                spdlog::debug("state cell '{}' has no name", id);
                return tl::unexpected<ParseError>(ParseError::UnnamedState);
            }

            bool is_initial  = ranges::find(toks, "$INITIAL"sv) != toks.end();
            bool is_terminal = ranges::find(toks, "$TERMINAL"sv) != toks.end();

            return DiagramState(id, name, is_initial, is_terminal);
        };

        // construct the states and copy into output tokens
        auto states = elements | views::filter(helpers::is_state) | views::transform(to_state);

        return utility::to_expected(states);
    }

    static auto symbols_from_label(std::string_view label) -> tl::expected<std::vector<char>, ParseError>
    {
        /*
        Labels are a comma separated list of single characters:
            (1) a
            (2) a, b, c
            (3) ,          // the comma itself
        */
        auto trimmed = utility::trim(label);
        if (trimmed.empty())
        {
            return tl::unexpected<ParseError>(ParseError::MissingArrowLabel);
        }
        if (trimmed == ",")
        {
            return std::vector<char>{','};
        }

        std::vector<char> symbols;
        for (auto item : helpers::split(trimmed, ','))
        {
            if (item.size() != 1)
            {
                return tl::unexpected<ParseError>(ParseError::InvalidArrowLabel);
            }
            symbols.push_back(item.front());
        }
        return symbols;
    }

    static auto arrows_from_xml_elements(const std::vector<XMLElement *> &elements)
        -> tl::expected<std::vector<DiagramArrow>, ParseError>
    {
        // labels dragged off an arrow live in their own cell, parented to the arrow
        std::unordered_map<std::string, std::string> detached_labels;
        for (auto *el : elements | views::filter(helpers::is_edge_label))
        {
            detached_labels.emplace(helpers::attribute(el, "parent"), helpers::attribute(el, "value"));
        }

        auto to_arrow = [&detached_labels](XMLElement *el) -> tl::expected<DiagramArrow, ParseError>
        {
            auto pSource = el->Attribute("source");
            if (!pSource)
            {
                return tl::unexpected<ParseError>(ParseError::MissingSourceArrow);
            }

            auto pTarget = el->Attribute("target");
            if (!pTarget)
            {
                return tl::unexpected<ParseError>(ParseError::MissingTargetArrow);
            }

            std::string id{helpers::attribute(el, "id")};
            std::string label{helpers::attribute(el, "value")};
            if (utility::trim(label).empty())
            {
                if (auto it = detached_labels.find(id); it != detached_labels.end())
                {
                    label = it->second;
                }
            }

            return symbols_from_label(label)
                .map([&](std::vector<char> symbols) {
                    return DiagramArrow(
                        id,
                        utility::strip_markup(pSource),
                        utility::strip_markup(pTarget),
                        symbols
                    );
                });
        };

        auto arrows = elements | views::filter(helpers::is_arrow) | views::transform(to_arrow);

        return utility::to_expected(arrows);
    }

    auto drawio_to_tokens(std::string_view drawio_xml_str) -> tl::expected<TokenTuple, ParseError>
    {
        XMLDocument doc;
        doc.Parse(drawio_xml_str.data(), drawio_xml_str.size());
        if (doc.ErrorID() != XML_SUCCESS)
        {
            return tl::unexpected<ParseError>(ParseError::InvalidDecodedDrawioFile);
        }

        XMLElement *origin = doc.RootElement();
        if (origin)
        {
            XMLElement *pRoot = origin->FirstChildElement("root");
            if (pRoot)
            {
                // extract all the cells from the diagram
                XMLElement *pCell = pRoot->FirstChildElement("mxCell");
                std::vector<XMLElement *> elements;
                while (pCell)
                {
                    if (pCell->Attribute("style"))
                    {
                        elements.push_back(pCell);
                    }
                    pCell = pCell->NextSiblingElement("mxCell");
                }
                spdlog::debug("diagram has {} styled cells", elements.size());

                auto states = states_from_xml_elements(elements);
                if (!states)
                {
                    return tl::unexpected<ParseError>(states.error());
                }
                auto arrows = arrows_from_xml_elements(elements);
                if (!arrows)
                {
                    return tl::unexpected<ParseError>(arrows.error());
                }

                return std::make_tuple(states.value(), arrows.value());
            }
        }
        return tl::unexpected<ParseError>(ParseError::InvalidDecodedDrawioFile);
    }

    auto read_diagram(const std::filesystem::path& path) -> tl::expected<TokenTuple, ParseError>
    {
        spdlog::debug("reading diagram {}", path.string());
        return extract_drawio(path)
            .and_then(decode_drawio)
            .and_then(drawio_to_tokens);
    }

    auto to_string(const ParseError err) -> std::string
    {
        switch (err)
        {
        case ParseError::EmptyPath:
            return "<EMPTY PATH> you provided an empty path to the draw.io diagram";
        case ParseError::InvalidEncodedDrawioFile:
            return "<INVALID ENCODED DRAWIO FILE ERROR> : you provided an invalid drawio file!";
        case ParseError::ExtractingDrawioString:
            return "<EXTRACT STRING ERROR> : Could not find a <diagram> in the draw.io file";
        case ParseError::URLDecodeError:
            return "<URL DECODE ERROR> : Could not decode the Draw.IO diagram"
                   " - are you sure you exported the XML in encoded format?";
        case ParseError::Base64DecodeError:
            return "<BASE64 DECODE ERROR> : Could not decode the Draw.IO diagram"
                   " - are you sure you exported the XML in encoded format?";
        case ParseError::InflationError:
            return "<INFLATION DECODE ERROR> : Could not decode the Draw.IO diagram"
                   " - are you sure you exported the XML in encoded format?";
        case ParseError::InvalidDecodedDrawioFile:
            return "<INVALID DECODED DRAWIO FILE ERROR> : the decoded diagram is not an mxGraphModel";
        case ParseError::MissingSourceArrow:
            return "<MISSING SOURCE ARROW> : One of your arrows is not correctly connected to its source";
        case ParseError::MissingTargetArrow:
            return "<MISSING TARGET ARROW> : One of your arrows is not correctly connected to its target";
        case ParseError::MissingArrowLabel:
            return "<MISSING ARROW LABEL> : One of your arrows has no symbol on it";
        case ParseError::InvalidArrowLabel:
            return "<INVALID ARROW LABEL> : Arrow labels must be a comma separated list of single characters";
        case ParseError::UnnamedState:
            return "<UNNAMED STATE> : One of your states has no name";
        }
        return "Something unexpected went wrong ... try again.";
    }

    // handle errors during parsing and token generation
    void HandleParseError(const ParseError err)
    {
        throw std::runtime_error(to_string(err));
    }
}
