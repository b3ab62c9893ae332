#pragma once

#include "fable_console.h"
#include "fable_runner.h"
#include <string>

namespace Fable {

// --- FablePlayer 설정 (JSON 파일 + 명령행 덮어쓰기) ---
struct PlayerConfig {
    std::string storyRoot = "resources";
    std::string startDocument = "example_1.txt";
    std::string startBlock = "start";
    std::string identity = "Default";
    std::string saveDirectory;   // 비어 있으면 SaveStore 기본 경로
    std::string documentSuffix = ".txt";
    std::string dictionaryFile;  // 비어 있으면 내장 사전만 사용

    bool debug = false;
    bool fastMode = false;
    bool color = true;
    int lineDelayMs = 1200;
    int typeDelayMs = 24;
    int maxConditionDepth = Resolver::DEFAULT_MAX_DEPTH;
    int maxAutoAdvance = 10000;

    // 알 수 없는 키는 무시, 타입이 틀리면 false + error (부분 적용 없음)
    bool loadFromFile(const std::string& filepath, std::string& error);
    bool loadFromString(const std::string& jsonText, std::string& error);

    RunnerConfig toRunnerConfig() const;
    ConsoleConfig toConsoleConfig() const;
};

} // namespace Fable
