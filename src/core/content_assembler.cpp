#include "core/content_assembler.hpp"

namespace folio {

AssembledDocument assemble(std::vector<Block> blocks) {
    sort_by_document_order(blocks);

    AssembledDocument doc;
    doc.offsets.reserve(blocks.size());
    doc.order.reserve(blocks.size());

    size_t total = 0;
    for (const auto& block : blocks) {
        total += block.markdown_fragment.size() + kBlockSeparator.size();
    }
    doc.text.reserve(total);

    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) {
            doc.text.append(kBlockSeparator);
        }
        doc.offsets[blocks[i].id] = doc.text.size();
        doc.order.push_back(blocks[i].id);
        doc.text.append(blocks[i].markdown_fragment);
    }
    return doc;
}

} // namespace folio
