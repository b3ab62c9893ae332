#pragma once
#include "fable_story.h"
#include <string>
#include <vector>
#include <unordered_set>
#include <ostream>

namespace Fable {

struct AnalysisIssue {
    enum Level { ERROR, WARNING, INFO };
    enum Kind {
        MISSING_TARGET,
        MISSING_DOCUMENT,
        DUPLICATE_BLOCK,
        UNREACHABLE_BLOCK,
        DEAD_END
    };
    Level level;
    Kind kind;
    std::string blockName;
    std::string detail;
};

struct AnalysisReport {
    // 메트릭
    int totalBlocks = 0;
    int reachableBlocks = 0;
    int totalTextLines = 0;
    int conditionalLines = 0;
    int totalChoices = 0;
    int documentTargets = 0;
    // 이슈
    std::vector<AnalysisIssue> issues;

    int count(AnalysisIssue::Level level) const;
};

class StoryAnalyzer {
public:
    // storyRoot가 비어 있지 않으면 문서 대상 파일의 존재도 검사
    explicit StoryAnalyzer(const std::string& documentSuffix = ".txt",
                           const std::string& storyRoot = "");

    // startBlock이 비어 있으면 첫 블록에서 시작
    AnalysisReport analyze(const Document& document, const std::string& startBlock = "") const;

    static void printReport(const AnalysisReport& report, std::ostream& out);

private:
    std::string documentSuffix_;
    std::string storyRoot_;

    std::unordered_set<std::string> findReachableBlocks(const Document& document,
                                                        const std::string& startBlock) const;
};

} // namespace Fable
