#include "fable_json_export.h"

using json = nlohmann::json;

namespace Fable {

const char* JsonExport::compareOpSymbol(CompareOp op) {
    switch (op) {
        case CompareOp::LESS:          return "<";
        case CompareOp::LESS_EQUAL:    return "<=";
        case CompareOp::EQUAL:         return "==";
        case CompareOp::GREATER_EQUAL: return ">=";
        case CompareOp::GREATER:       return ">";
    }
    return "?";
}

// =================================================================
// Text node tree
// =================================================================
json JsonExport::serializeNode(const TextNode* node) {
    if (!node) return nullptr;

    json j;
    switch (node->kind) {
        case TextNode::PLAIN:
            j["type"] = "Plain";
            j["text"] = node->text;
            break;

        case TextNode::COLOR_HINT:
            j["type"] = "ColorHint";
            j["text"] = node->text;
            j["highlight"] = highlightName(node->highlight);
            if (node->question) j["question"] = true;
            break;

        case TextNode::FLAG_CONDITIONAL:
            j["type"] = "FlagConditional";
            j["flag"] = node->text;
            j["then"] = serializeNode(node->thenNode.get());
            j["else"] = serializeNode(node->elseNode.get());
            break;

        case TextNode::COUNTER_CONDITIONAL:
            j["type"] = "CounterConditional";
            j["counter"] = node->text;
            j["op"] = compareOpSymbol(node->op);
            j["value"] = node->operand;
            j["then"] = serializeNode(node->thenNode.get());
            j["else"] = serializeNode(node->elseNode.get());
            break;
    }
    return j;
}

json JsonExport::serializeTextLine(const std::string& line, const Resolver& resolver) {
    json j;
    j["raw"] = line;

    std::unique_ptr<TextNode> root;
    std::string error;
    if (resolver.compile(line, root, error)) {
        j["node"] = serializeNode(root.get());
    } else {
        j["node"] = nullptr;
        j["error"] = error;
    }
    return j;
}

// =================================================================
// Choices / blocks
// =================================================================
json JsonExport::serializeChoice(const Choice& choice, const std::string& documentSuffix) {
    json j;
    j["label"] = choice.label;
    j["keywords"] = choice.keywords;
    j["target"] = choice.target;
    j["target_is_document"] = isDocumentTarget(choice.target, documentSuffix);
    if (Resolver::isConditional(choice.label)) {
        j["conditional"] = true;
    }
    return j;
}

json JsonExport::serializeBlock(const Block& block, const Resolver& resolver,
                                const std::string& documentSuffix) {
    json j;
    j["name"] = block.name;

    json text = json::array();
    for (const auto& line : block.text) {
        text.push_back(serializeTextLine(line, resolver));
    }
    j["text"] = text;

    json choices = json::array();
    for (const auto& choice : block.choices) {
        choices.push_back(serializeChoice(choice, documentSuffix));
    }
    j["choices"] = choices;

    // std::map → JSON object (키 정렬 유지)
    j["flags"] = block.flagEffects;
    j["counters"] = block.counterEffects;
    return j;
}

// =================================================================
// Main export
// =================================================================
json JsonExport::toJson(const Document& document, const std::string& documentSuffix) {
    json root;

    // Metadata
    root["format"] = "fable-json";
    root["format_version"] = 1;
    root["document"] = document.name;

    const Block* first = document.firstBlock();
    root["start_block"] = first ? json(first->name) : json(nullptr);

    Resolver resolver;
    json blocks = json::array();
    for (const auto& block : document.blocks) {
        blocks.push_back(serializeBlock(block, resolver, documentSuffix));
    }
    root["blocks"] = blocks;

    return root;
}

std::string JsonExport::toJsonString(const Document& document, int indent,
                                     const std::string& documentSuffix) {
    return toJson(document, documentSuffix).dump(indent);
}

} // namespace Fable
