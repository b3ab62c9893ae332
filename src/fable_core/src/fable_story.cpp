#include "fable_story.h"

namespace Fable {

const Block* Document::findBlock(const std::string& blockName) const {
    for (const auto& block : blocks) {
        if (block.name == blockName) {
            return &block;
        }
    }
    return nullptr;
}

bool isDocumentTarget(const std::string& target, const std::string& suffix) {
    if (suffix.empty() || target.size() <= suffix.size()) return false;
    return target.compare(target.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace Fable
