#pragma once
#include "fable_story.h"
#include "fable_environment.h"
#include "fable_resolver.h"
#include "fable_matcher.h"
#include <string>
#include <vector>
#include <unordered_map>

namespace Fable {

// --- step() 결과 ---
enum class StepType { LINE, CHOICES, END };

// END 사유
enum class EndReason {
    NONE,
    STORY_END,          // 선택지가 없는 블록에서 정상 종료
    BLOCK_NOT_FOUND,
    TARGET_NOT_FOUND,
    DOCUMENT_NOT_FOUND,
    MALFORMED_DOCUMENT,
    AUTO_ADVANCE_LIMIT,
    GAME_OVER           // 효과 적용 후 game_over 플래그가 켜짐
};

const char* endReasonName(EndReason reason);

struct ChoiceData {
    std::string text;
    int index = 0; // 0부터 시작 (표시 번호는 index + 1)
};

struct StepResult {
    StepType type = StepType::END;
    RenderLine line;
    std::vector<ChoiceData> choices;
    EndReason endReason = EndReason::NONE;
};

struct RunnerConfig {
    std::string storyRoot = "resources";   // 문서 파일 디렉터리
    std::string documentSuffix = ".txt";   // 이 접미사로 끝나는 대상은 문서
    int maxConditionDepth = Resolver::DEFAULT_MAX_DEPTH;
    int maxAutoAdvance = 10000;            // 출력 없는 연속 자동 진행 한도
    bool debug = false;
};

// --- Runner (블록 인터프리터) ---
class Runner {
public:
    Runner();
    explicit Runner(const RunnerConfig& config);

    // 메모리 문서 등록 (파일 시스템보다 우선)
    void addDocumentSource(const std::string& name, const std::string& source);

    // 시작 문서 파싱 실패는 false (치명적). 블록이 없으면 BLOCK_NOT_FOUND로 종료.
    bool start(const std::string& documentName, const std::string& blockName);

    // 로드된 Environment의 위치에서 재개. 효과는 다시 적용하지 않는다.
    // 문서나 블록을 찾지 못하면 false, 현재 상태는 바뀌지 않는다.
    bool resume(const Environment& env);

    StepResult step();

    // 정규화된 입력으로 선택. 매칭 실패 시 false.
    bool choose(const std::string& sanitizedInput);
    void choose(int index);

    bool isFinished() const { return phase_ == Phase::FINISHED; }
    bool isAwaitingChoice() const { return phase_ == Phase::AWAITING_CHOICE; }
    EndReason getEndReason() const { return endReason_; }

    // Environment 접근
    Environment& environment() { return env_; }
    const Environment& environment() const { return env_; }
    void setEnvironment(const Environment& env) { env_ = env; }

    void setDictionary(const Dictionary* dictionary) { matcher_.setDictionary(dictionary); }

    const Document& getDocument() const { return document_; }
    std::string getCurrentBlockName() const;
    const std::vector<Choice>& getPresentedChoices() const { return presented_; }

    // 마지막 에러 (문서 로드 실패, 블록/대상 없음)
    const std::string& getLastError() const { return lastError_; }
    const RunnerConfig& getConfig() const { return config_; }

private:
    enum class Phase { RENDERING, AWAITING_CHOICE, FINISHED };

    RunnerConfig config_;
    Resolver resolver_;
    InputMatcher matcher_;
    Environment env_;

    Document document_;
    const Block* block_ = nullptr; // document_.blocks 내부를 가리킴
    size_t pc_ = 0;                // 다음에 렌더링할 텍스트 줄
    bool skipEffects_ = false;     // resume 직후 한 번
    Phase phase_ = Phase::FINISHED;
    EndReason endReason_ = EndReason::NONE;
    std::vector<Choice> presented_; // 필터링된 선택지 (라벨 해석 완료)
    std::string lastError_;

    std::unordered_map<std::string, std::string> sources_;

    // 헬퍼
    bool loadDocument(const std::string& name, Document& outDoc, EndReason& failure);
    void enterBlock(const Block& block);
    void applyEffects(const Block& block);
    void filterChoices(const Block& block);
    void followTarget(std::string target); // presented_ 원소를 참조할 수 있으므로 복사
    void finish(EndReason reason);
    void fillChoices(StepResult& result) const;
};

} // namespace Fable
