#include "fable_resolver.h"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <cstdint>

namespace Fable {

static const char* ARROW = " => ";
static const size_t ARROW_LEN = 4;

const char* highlightName(Highlight highlight) {
    switch (highlight) {
        case Highlight::DEFAULT: return "default";
        case Highlight::YELLOW:  return "yellow";
        case Highlight::BLUE:    return "blue";
        case Highlight::GREEN:   return "green";
        case Highlight::RED:     return "red";
        case Highlight::CYAN:    return "cyan";
        case Highlight::PURPLE:  return "purple";
    }
    return "default";
}

// --- 유틸리티 ---
static std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

static bool startsWith(const std::string& text, const char* prefix) {
    return text.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// "-y " 형태의 색상 지시자
static bool colorPrefix(const std::string& line, Highlight& out) {
    if (line.size() < 3 || line[0] != '-' || line[2] != ' ') return false;
    switch (line[1]) {
        case 'y': out = Highlight::YELLOW; return true;
        case 'b': out = Highlight::BLUE;   return true;
        case 'g': out = Highlight::GREEN;  return true;
        case 'r': out = Highlight::RED;    return true;
        case 'c': out = Highlight::CYAN;   return true;
        case 'p': out = Highlight::PURPLE; return true;
        default:  return false;
    }
}

static bool parseOperator(const std::string& token, CompareOp& out) {
    if (token == "<")  { out = CompareOp::LESS;          return true; }
    if (token == "<=") { out = CompareOp::LESS_EQUAL;    return true; }
    if (token == "==") { out = CompareOp::EQUAL;         return true; }
    if (token == ">=") { out = CompareOp::GREATER_EQUAL; return true; }
    if (token == ">")  { out = CompareOp::GREATER;       return true; }
    return false;
}

Resolver::Resolver(int maxDepth)
    : maxDepth_(maxDepth > 0 ? maxDepth : DEFAULT_MAX_DEPTH) {}

bool Resolver::isConditional(const std::string& line) {
    return startsWith(line, "?-") || startsWith(line, "#-");
}

// =================================================================
// 컴파일 (라인 → AST)
// =================================================================
bool Resolver::compile(const std::string& line, std::unique_ptr<TextNode>& outNode,
                       std::string& error) const {
    outNode.reset();
    error.clear();
    return compileNode(line, 0, outNode, error);
}

bool Resolver::compileNode(const std::string& line, int depth,
                           std::unique_ptr<TextNode>& outNode, std::string& error) const {
    if (depth > maxDepth_) {
        error = "conditional nesting exceeds " + std::to_string(maxDepth_) + " levels";
        return false;
    }

    auto node = std::make_unique<TextNode>();

    // ?- flag => then [=> else]
    if (startsWith(line, "?-")) {
        if (line.size() < 3 || line[2] != ' ') {
            error = "expected a space after '?-'";
            return false;
        }
        size_t arrow = line.find(ARROW, 3);
        if (arrow == std::string::npos) {
            error = "flag conditional requires ' => ' after the flag name";
            return false;
        }
        std::string flagName = trim(line.substr(3, arrow - 3));
        if (flagName.empty()) {
            error = "missing flag name in conditional";
            return false;
        }
        if (flagName.find_first_of(" \t") != std::string::npos) {
            error = "flag name must be a single word: '" + flagName + "'";
            return false;
        }
        node->kind = TextNode::FLAG_CONDITIONAL;
        node->text = flagName;
        if (!compileBranches(line.substr(arrow + ARROW_LEN), depth, *node, error)) return false;
        outNode = std::move(node);
        return true;
    }

    // #- counter OP int => then [=> else]
    if (startsWith(line, "#-")) {
        if (line.size() < 3 || line[2] != ' ') {
            error = "expected a space after '#-'";
            return false;
        }
        size_t arrow = line.find(ARROW, 3);
        if (arrow == std::string::npos) {
            error = "counter conditional requires ' => ' after the comparison";
            return false;
        }

        std::istringstream iss(line.substr(3, arrow - 3));
        std::string counterName, opToken, valueToken, extra;
        iss >> counterName >> opToken >> valueToken;
        if (counterName.empty() || opToken.empty() || valueToken.empty() || (iss >> extra)) {
            error = "counter conditional must be '#- name OP int'";
            return false;
        }
        if (!parseOperator(opToken, node->op)) {
            error = "unknown comparison operator '" + opToken + "' (expected <, <=, ==, >=, >)";
            return false;
        }
        char* end = nullptr;
        long value = std::strtol(valueToken.c_str(), &end, 10);
        if (end == valueToken.c_str() || *end != '\0') {
            error = "expected integer after '" + opToken + "', got '" + valueToken + "'";
            return false;
        }
        if (value < INT32_MIN || value > INT32_MAX) {
            error = "counter operand out of range: " + valueToken;
            return false;
        }

        node->kind = TextNode::COUNTER_CONDITIONAL;
        node->text = counterName;
        node->operand = static_cast<int32_t>(value);
        if (!compileBranches(line.substr(arrow + ARROW_LEN), depth, *node, error)) return false;
        outNode = std::move(node);
        return true;
    }

    Highlight color = Highlight::DEFAULT;
    if (colorPrefix(line, color)) {
        node->kind = TextNode::COLOR_HINT;
        node->highlight = color;
        node->text = line.substr(3);
    } else if (startsWith(line, "  ")) {
        node->kind = TextNode::COLOR_HINT;
        node->highlight = Highlight::CYAN;
        node->question = true;
        node->text = line;
    } else {
        node->kind = TextNode::PLAIN;
        node->text = line;
    }
    outNode = std::move(node);
    return true;
}

// 분기 문법:
//   나머지가 조건문으로 시작하면 나머지 전체가 then (중첩, 바깥 else 없음)
//   아니면 다음 " => " 까지 then, 그 뒤 전체가 else (else-if 체인 가능)
bool Resolver::compileBranches(const std::string& rest, int depth, TextNode& node,
                               std::string& error) const {
    if (isConditional(rest)) {
        return compileNode(rest, depth + 1, node.thenNode, error);
    }

    size_t arrow = rest.find(ARROW);
    if (arrow == std::string::npos) {
        return compileNode(rest, depth + 1, node.thenNode, error);
    }

    if (!compileNode(rest.substr(0, arrow), depth + 1, node.thenNode, error)) return false;
    return compileNode(rest.substr(arrow + ARROW_LEN), depth + 1, node.elseNode, error);
}

// =================================================================
// 평가
// =================================================================
bool Resolver::evaluateCondition(const TextNode& node, const Environment& env) {
    if (node.kind == TextNode::FLAG_CONDITIONAL) {
        return env.getFlag(node.text);
    }

    int32_t value = env.getCounter(node.text);
    switch (node.op) {
        case CompareOp::LESS:          return value < node.operand;
        case CompareOp::LESS_EQUAL:    return value <= node.operand;
        case CompareOp::EQUAL:         return value == node.operand;
        case CompareOp::GREATER_EQUAL: return value >= node.operand;
        case CompareOp::GREATER:       return value > node.operand;
    }
    return false;
}

bool Resolver::resolve(const std::string& line, const Environment& env, RenderLine& out) const {
    std::unique_ptr<TextNode> root;
    std::string error;
    if (!compile(line, root, error)) {
        std::cerr << "[Fable] Malformed text line skipped: " << error << std::endl;
        return false;
    }

    // 조건문 체인을 반복적으로 따라감
    const TextNode* node = root.get();
    while (node && (node->kind == TextNode::FLAG_CONDITIONAL
                    || node->kind == TextNode::COUNTER_CONDITIONAL)) {
        node = evaluateCondition(*node, env) ? node->thenNode.get() : node->elseNode.get();
    }
    if (!node) return false;

    out = RenderLine();
    out.text = node->text;
    if (node->kind == TextNode::COLOR_HINT) {
        out.highlight = node->highlight;
        out.question = node->question;
    }
    out.spans = splitQuotes(out.text, out.highlight);
    return true;
}

bool Resolver::resolveLabel(const std::string& label, const Environment& env,
                            std::string& outLabel) const {
    std::unique_ptr<TextNode> root;
    std::string error;
    if (!compile(label, root, error)) {
        std::cerr << "[Fable] Malformed choice label dropped: " << error << std::endl;
        return false;
    }

    const TextNode* node = root.get();
    while (node && (node->kind == TextNode::FLAG_CONDITIONAL
                    || node->kind == TextNode::COUNTER_CONDITIONAL)) {
        if (!evaluateCondition(*node, env)) return false;
        node = node->thenNode.get();
    }
    if (!node) return false;

    outLabel = node->text;
    return true;
}

std::vector<TextSpan> Resolver::splitQuotes(const std::string& text, Highlight highlight) {
    std::vector<TextSpan> spans;

    size_t quotes = 0;
    for (char c : text) {
        if (c == '"') quotes++;
    }

    if (quotes < 2 || highlight == Highlight::DEFAULT) {
        spans.push_back({text, highlight});
        return spans;
    }

    // 따옴표 문자 자체도 강조 색상
    bool inQuote = false;
    TextSpan current;
    current.highlight = Highlight::DEFAULT;
    for (char c : text) {
        Highlight want;
        if (c == '"') {
            want = highlight;
        } else {
            want = inQuote ? highlight : Highlight::DEFAULT;
        }
        if (want != current.highlight && !current.text.empty()) {
            spans.push_back(std::move(current));
            current = TextSpan();
        }
        current.highlight = want;
        current.text += c;
        if (c == '"') inQuote = !inQuote;
    }
    if (!current.text.empty()) {
        spans.push_back(std::move(current));
    }
    return spans;
}

} // namespace Fable
