#pragma once
#include "viewtree.h"

namespace vsx {

struct ParseOptions {
    bool preserveWhitespace = true;   // otherwise runs of whitespace collapse to one space
};

// Parses children [from, to) of a view node into a copy of `context`
// holding the parsed content. Textblock contexts parse inline content,
// other contexts parse blocks, wrapping stray inline content in paragraphs.
NodePtr parseRegion(const ViewNode* parent, int from, int to,
                    const Node& context, const ParseOptions& options = {});

// Parses a whole rendered view back into a document
NodePtr parseView(const ViewNode* root, const ParseOptions& options = {});

} // namespace vsx
