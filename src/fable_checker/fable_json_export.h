#pragma once
#include "fable_story.h"
#include "fable_resolver.h"
#include <nlohmann/json.hpp>
#include <string>

namespace Fable {

/**
 * JSON export for parsed Fable documents.
 *
 * Converts a Document to a human-readable JSON representation.
 * Conditional text lines are exported together with their compiled
 * branch tree so external tools can inspect them without re-parsing
 * the markup.
 */
class JsonExport {
public:
    /// Convert a Document to a JSON object
    static nlohmann::json toJson(const Document& document,
                                 const std::string& documentSuffix = ".txt");

    /// Convert a Document to a pretty-printed JSON string
    static std::string toJsonString(const Document& document, int indent = 2,
                                    const std::string& documentSuffix = ".txt");

private:
    static nlohmann::json serializeBlock(const Block& block, const Resolver& resolver,
                                         const std::string& documentSuffix);
    static nlohmann::json serializeChoice(const Choice& choice,
                                          const std::string& documentSuffix);
    static nlohmann::json serializeTextLine(const std::string& line, const Resolver& resolver);
    static nlohmann::json serializeNode(const TextNode* node);
    static const char* compareOpSymbol(CompareOp op);
};

} // namespace Fable
