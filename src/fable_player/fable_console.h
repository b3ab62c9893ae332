#pragma once

#include "fable_resolver.h"
#include "fable_runner.h"
#include <ostream>
#include <random>
#include <string>
#include <vector>

namespace Fable {

struct ConsoleConfig {
    bool fastMode = false;   // 지연 없이 즉시 출력
    int lineDelayMs = 1200;  // 줄 끝 대기
    int typeDelayMs = 24;    // 글자당 대기 (x [0.25, 1.25) 무작위)
    bool color = true;       // ANSI 색상 사용
};

// --- 타자기 효과 콘솔 출력 ---
class ConsoleWriter {
public:
    explicit ConsoleWriter(std::ostream& out, const ConsoleConfig& config = ConsoleConfig());

    // 스토리 텍스트 한 줄. 질문 프롬프트는 앞에 빈 줄.
    void writeLine(const RenderLine& line);

    // 엔진 메시지 ("Game Saved!" 등). fast = 줄 끝 대기 절반.
    void typeText(const std::string& text, Highlight highlight = Highlight::DEFAULT,
                  bool fast = false);

    // "1) label" 형식 번호 목록
    void writeChoices(const std::vector<ChoiceData>& choices);

    void blankLine();

    const ConsoleConfig& getConfig() const { return config_; }

    static const char* colorCode(Highlight highlight);

private:
    std::ostream& out_;
    ConsoleConfig config_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> jitter_;

    void typeSpans(const std::vector<TextSpan>& spans, bool fast);
    void nap(double milliseconds);
};

} // namespace Fable
