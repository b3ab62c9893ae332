#pragma once
#include "fable_environment.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace Fable {

// --- 출력 강조 색상 ---
enum class Highlight { DEFAULT, YELLOW, BLUE, GREEN, RED, CYAN, PURPLE };

const char* highlightName(Highlight highlight);

// 따옴표 구간 분할 결과
struct TextSpan {
    std::string text;
    Highlight highlight = Highlight::DEFAULT;
};

// resolve() 결과: 렌더러에 넘길 한 줄
struct RenderLine {
    std::string text;
    Highlight highlight = Highlight::DEFAULT;
    bool question = false;       // 두 칸 들여쓴 질문 프롬프트
    std::vector<TextSpan> spans; // 항상 1개 이상 (text 전체를 덮음)
};

enum class CompareOp { LESS, LESS_EQUAL, EQUAL, GREATER_EQUAL, GREATER };

// --- 조건부 텍스트 AST ---
struct TextNode {
    enum Kind { PLAIN, FLAG_CONDITIONAL, COUNTER_CONDITIONAL, COLOR_HINT };

    Kind kind = PLAIN;
    std::string text;  // PLAIN/COLOR_HINT: 표시 텍스트, 조건문: flag/counter 이름
    Highlight highlight = Highlight::DEFAULT; // COLOR_HINT
    bool question = false;                    // COLOR_HINT (질문 프롬프트)
    CompareOp op = CompareOp::EQUAL;          // COUNTER_CONDITIONAL
    int32_t operand = 0;                      // COUNTER_CONDITIONAL
    std::unique_ptr<TextNode> thenNode;
    std::unique_ptr<TextNode> elseNode;       // nullptr = else 없음
};

class Resolver {
public:
    static constexpr int DEFAULT_MAX_DEPTH = 32;

    explicit Resolver(int maxDepth = DEFAULT_MAX_DEPTH);

    // 라인을 AST로 컴파일. 형식 오류 시 false + error.
    bool compile(const std::string& line, std::unique_ptr<TextNode>& outNode,
                 std::string& error) const;

    // 텍스트 라인 해석. 조건이 맞는 분기가 없으면 false (출력 없음).
    bool resolve(const std::string& line, const Environment& env, RenderLine& out) const;

    // 선택지 라벨 해석. then 경로의 모든 조건이 참이어야 true. else는 무시.
    bool resolveLabel(const std::string& label, const Environment& env,
                      std::string& outLabel) const;

    static bool isConditional(const std::string& line);

    // 따옴표가 2개 이상이면 따옴표 구간에만 강조 적용
    static std::vector<TextSpan> splitQuotes(const std::string& text, Highlight highlight);

    int getMaxDepth() const { return maxDepth_; }

private:
    int maxDepth_;

    bool compileNode(const std::string& line, int depth,
                     std::unique_ptr<TextNode>& outNode, std::string& error) const;
    bool compileBranches(const std::string& rest, int depth, TextNode& node,
                         std::string& error) const;
    static bool evaluateCondition(const TextNode& node, const Environment& env);
};

} // namespace Fable
