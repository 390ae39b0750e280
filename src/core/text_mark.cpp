/**
 * @file    text_mark.cpp
 * @brief   Invisible text mark implementation
 * @license MIT
 */

#include "core/text_mark.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace dmt {

TextMarkEmbedder::TextMarkEmbedder(std::string closing_tag)
    : closing_tag_(std::move(closing_tag)) {
    if (closing_tag_.empty()) {
        throw ValidationError("text mark: closing tag must not be empty");
    }
}

void TextMarkEmbedder::embed_into_scope(std::span<TextNode> scope,
                                        const Payload& payload) const {
    if (scope.empty()) {
        throw ValidationError("text mark: embedding scope is empty");
    }

    // Encode once, every node gets its own copy of the same run
    const std::string run = codec_.encode(payload);
    for (TextNode& node : scope) {
        node.text += run;
    }

    spdlog::debug("Embedded {} byte payload into {} text node(s)",
                  payload.size(), scope.size());
}

std::string TextMarkEmbedder::embed_into_document(std::string_view markup,
                                                  const Payload& payload) const {
    const auto pos = markup.find(closing_tag_);
    if (pos == std::string_view::npos) {
        throw ValidationError("text mark: insertion point '" + closing_tag_ +
                              "' not found in document");
    }

    const std::string run = codec_.encode(payload);

    std::string out;
    out.reserve(markup.size() + run.size());
    out.append(markup.substr(0, pos));
    out.append(run);
    out.append(markup.substr(pos));

    spdlog::debug("Embedded {} byte payload before '{}' at offset {}",
                  payload.size(), closing_tag_, pos);
    return out;
}

Payload TextMarkExtractor::extract_from_scope(std::span<const TextNode> scope) const {
    std::string flattened;
    for (const TextNode& node : scope) {
        flattened += node.text;
    }
    return codec_.decode(flattened);
}

Payload TextMarkExtractor::extract_from_document(std::string_view markup) const {
    return codec_.decode(markup);
}

}  // namespace dmt
