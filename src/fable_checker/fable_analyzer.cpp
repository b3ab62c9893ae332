#include "fable_analyzer.h"
#include "fable_resolver.h"
#include <filesystem>
#include <queue>
#include <unordered_map>

namespace Fable {

int AnalysisReport::count(AnalysisIssue::Level level) const {
    int n = 0;
    for (const auto& issue : issues) {
        if (issue.level == level) n++;
    }
    return n;
}

StoryAnalyzer::StoryAnalyzer(const std::string& documentSuffix, const std::string& storyRoot)
    : documentSuffix_(documentSuffix), storyRoot_(storyRoot) {}

// =================================================================
// 도달 가능 블록 (BFS)
// =================================================================
std::unordered_set<std::string> StoryAnalyzer::findReachableBlocks(
    const Document& document, const std::string& startBlock) const {

    std::unordered_set<std::string> reachable;
    std::queue<const Block*> queue;

    const Block* start = startBlock.empty()
        ? document.firstBlock()
        : document.findBlock(startBlock);
    if (!start) return reachable;

    reachable.insert(start->name);
    queue.push(start);

    while (!queue.empty()) {
        const Block* current = queue.front();
        queue.pop();

        for (const auto& choice : current->choices) {
            if (isDocumentTarget(choice.target, documentSuffix_)) continue;

            // 실행 시점과 같이 첫 번째 같은 이름 블록만 도달 가능
            const Block* next = document.findBlock(choice.target);
            if (next && reachable.insert(next->name).second) {
                queue.push(next);
            }
        }
    }
    return reachable;
}

// =================================================================
// 분석
// =================================================================
AnalysisReport StoryAnalyzer::analyze(const Document& document,
                                      const std::string& startBlock) const {
    AnalysisReport report;
    report.totalBlocks = static_cast<int>(document.blocks.size());

    // 중복 블록 이름
    std::unordered_map<std::string, int> seen;
    for (const auto& block : document.blocks) {
        if (++seen[block.name] == 2) {
            report.issues.push_back({AnalysisIssue::WARNING, AnalysisIssue::DUPLICATE_BLOCK,
                block.name,
                "Duplicate block '" + block.name + "' (only the first one is reachable)"});
        }
    }

    std::unordered_set<std::string> missingDocs;
    for (const auto& block : document.blocks) {
        report.totalTextLines += static_cast<int>(block.text.size());
        for (const auto& line : block.text) {
            if (Resolver::isConditional(line)) report.conditionalLines++;
        }
        report.totalChoices += static_cast<int>(block.choices.size());

        if (block.choices.empty()) {
            report.issues.push_back({AnalysisIssue::INFO, AnalysisIssue::DEAD_END,
                block.name, "Block '" + block.name + "' has no choices (story ends here)"});
        }

        for (const auto& choice : block.choices) {
            if (isDocumentTarget(choice.target, documentSuffix_)) {
                report.documentTargets++;
                if (storyRoot_.empty() || missingDocs.count(choice.target)) continue;

                std::error_code ec;
                auto path = std::filesystem::path(storyRoot_) / choice.target;
                if (!std::filesystem::is_regular_file(path, ec)) {
                    missingDocs.insert(choice.target);
                    report.issues.push_back({AnalysisIssue::ERROR,
                        AnalysisIssue::MISSING_DOCUMENT, block.name,
                        "Block '" + block.name + "' targets missing document '"
                            + choice.target + "'"});
                }
                continue;
            }

            if (!document.findBlock(choice.target)) {
                report.issues.push_back({AnalysisIssue::ERROR, AnalysisIssue::MISSING_TARGET,
                    block.name,
                    "Block '" + block.name + "' targets missing block '" + choice.target + "'"});
            }
        }
    }

    // 도달 불가 블록
    auto reachable = findReachableBlocks(document, startBlock);
    report.reachableBlocks = static_cast<int>(reachable.size());

    std::unordered_set<std::string> reported;
    for (const auto& block : document.blocks) {
        if (reachable.count(block.name) || !reported.insert(block.name).second) continue;
        report.issues.push_back({AnalysisIssue::WARNING, AnalysisIssue::UNREACHABLE_BLOCK,
            block.name, "Unreachable block '" + block.name + "'"});
    }

    return report;
}

// =================================================================
// 리포트 출력
// =================================================================
void StoryAnalyzer::printReport(const AnalysisReport& report, std::ostream& out) {
    out << "=== Fable Analysis Report ===\n\n";

    out << "[Summary]\n";
    out << "  Blocks: " << report.totalBlocks
        << " (" << report.reachableBlocks << " reachable)\n";
    out << "  Text lines: " << report.totalTextLines
        << " (" << report.conditionalLines << " conditional)\n";
    out << "  Choices: " << report.totalChoices << "\n";
    out << "  Document targets: " << report.documentTargets << "\n";
    out << "\n";

    static const struct {
        AnalysisIssue::Level level;
        const char* title;
        const char* prefix;
    } sections[] = {
        {AnalysisIssue::ERROR,   "[Errors]",   "  E: "},
        {AnalysisIssue::WARNING, "[Warnings]", "  W: "},
        {AnalysisIssue::INFO,    "[Info]",     "  I: "},
    };

    for (const auto& section : sections) {
        if (report.count(section.level) == 0) continue;
        out << section.title << "\n";
        for (const auto& issue : report.issues) {
            if (issue.level == section.level) {
                out << section.prefix << issue.detail << "\n";
            }
        }
        out << "\n";
    }

    if (report.issues.empty()) {
        out << "No issues found.\n";
    }
}

} // namespace Fable
