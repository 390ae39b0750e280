/**
 * @file    text_mark.hpp
 * @brief   Invisible text marks: embed/extract zero-width payloads
 * @license MIT
 *
 * @details
 * Two embedding disciplines are supported:
 *   - scope:    append the marker run to the trailing text of every node
 *   - document: insert the marker run once before a designated closing tag
 *
 * Extraction does not care which one was used. It concatenates the scoped
 * text in order and decodes all markers as one stream, so nodes carrying
 * different payloads mix into a single byte sequence. Use one scope per
 * distinct payload.
 */

#pragma once

#include "core/bit_codec.hpp"

#include <span>
#include <string>
#include <string_view>

namespace dmt {

/**
 * A text-bearing node (element text content, paragraph, table cell...)
 */
struct TextNode {
    std::string text;
};

class TextMarkEmbedder {
public:
    /**
     * @param closing_tag  Literal tag the document marker run goes before
     * @throws ValidationError if closing_tag is empty
     */
    explicit TextMarkEmbedder(std::string closing_tag = "</body>");

    /**
     * Append the encoded payload to the text of every node in scope
     *
     * Calling this again on overlapping scopes appends further runs.
     * @throws ValidationError if scope is empty
     */
    void embed_into_scope(std::span<TextNode> scope, const Payload& payload) const;

    /**
     * Insert the encoded payload immediately before the closing tag
     *
     * The first occurrence of the tag is used. The input is never modified.
     * @throws ValidationError if the closing tag is absent
     */
    std::string embed_into_document(std::string_view markup, const Payload& payload) const;

    const std::string& closing_tag() const noexcept { return closing_tag_; }

private:
    BitCodec codec_;
    std::string closing_tag_;
};

class TextMarkExtractor {
public:
    /**
     * Decode the in-order concatenation of the scoped nodes' text
     */
    Payload extract_from_scope(std::span<const TextNode> scope) const;

    /**
     * Decode raw markup; markers survive any surrounding tags
     */
    Payload extract_from_document(std::string_view markup) const;

private:
    BitCodec codec_;
};

}  // namespace dmt
