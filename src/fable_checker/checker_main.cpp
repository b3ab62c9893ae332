#include "fable_parser.h"
#include "fable_analyzer.h"
#include "fable_json_export.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <cstring>

static const char* VERSION = "0.1.0";

static void printUsage() {
    std::cout << "Fable Check v" << VERSION << "\n"
              << "Usage: FableCheck <story.txt> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --analyze [path]     Run analysis report (default: stdout)\n"
              << "  --export-json <path> Write the parsed document as JSON\n"
              << "  --suffix <ext>       Document target suffix (default: .txt)\n"
              << "  --start <block>      Block the analysis starts from (default: first)\n"
              << "  -h, --help           Show this help message\n"
              << "  --version            Show version number\n";
}

int main(int argc, char* argv[]) {
    // help/version 플래그 체크 (위치 무관)
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            printUsage();
            return 0;
        }
        if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "FableCheck " << VERSION << std::endl;
            return 0;
        }
    }

    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string inputPath = argv[1];
    std::string analyzePath;
    std::string exportPath;
    std::string suffix = ".txt";
    std::string startBlock;
    bool doAnalyze = false;

    // 옵션 파싱
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--analyze") == 0) {
            doAnalyze = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                analyzePath = argv[++i];
            }
        } else if (std::strcmp(argv[i], "--export-json") == 0 && i + 1 < argc) {
            exportPath = argv[++i];
        } else if (std::strcmp(argv[i], "--suffix") == 0 && i + 1 < argc) {
            suffix = argv[++i];
        } else if (std::strcmp(argv[i], "--start") == 0 && i + 1 < argc) {
            startBlock = argv[++i];
        }
    }

    Fable::Parser parser;

    if (!parser.parse(inputPath)) {
        const auto& errors = parser.getErrors();
        for (const auto& err : errors) {
            std::cerr << "error: " << err << std::endl;
        }
        std::cerr << "\n" << errors.size() << " error(s). Check failed." << std::endl;
        return 1;
    }

    // 경고 출력
    if (parser.hasWarnings()) {
        for (const auto& warn : parser.getWarnings()) {
            std::cerr << "warning: " << warn << std::endl;
        }
    }

    const Fable::Document& document = parser.getDocument();
    int exitCode = 0;

    // 분석 리포트 (문서 대상은 입력 파일과 같은 디렉터리에서 찾는다)
    if (doAnalyze) {
        std::string root = std::filesystem::path(inputPath).parent_path().string();
        if (root.empty()) root = ".";

        Fable::StoryAnalyzer analyzer(suffix, root);
        auto report = analyzer.analyze(document, startBlock);

        if (analyzePath.empty()) {
            Fable::StoryAnalyzer::printReport(report, std::cout);
        } else {
            std::ofstream ofs(analyzePath);
            if (ofs.is_open()) {
                Fable::StoryAnalyzer::printReport(report, ofs);
                std::cout << "Analysis report: " << analyzePath << std::endl;
            } else {
                std::cerr << "Failed to write analysis report: " << analyzePath << std::endl;
                return 1;
            }
        }

        if (report.count(Fable::AnalysisIssue::ERROR) > 0) {
            exitCode = 2;
        }
    }

    // JSON 내보내기
    if (!exportPath.empty()) {
        std::ofstream ofs(exportPath);
        if (!ofs.is_open()) {
            std::cerr << "Failed to write JSON export: " << exportPath << std::endl;
            return 1;
        }
        ofs << Fable::JsonExport::toJsonString(document, 2, suffix) << std::endl;
        std::cout << "JSON export: " << exportPath << std::endl;
    }

    return exitCode;
}
