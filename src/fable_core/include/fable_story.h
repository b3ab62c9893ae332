#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace Fable {

// --- 선택지 ---
struct Choice {
    std::string label;    // 표시 텍스트 (선두 조건문 허용, then 분기만 사용)
    std::string keywords; // 부분 문자열 매칭 또는 "@사전이름"
    std::string target;   // 블록 이름 또는 문서 이름 (접미사로 구분)

    bool operator==(const Choice& other) const {
        return label == other.label && keywords == other.keywords && target == other.target;
    }
    bool operator!=(const Choice& other) const { return !(*this == other); }
};

// --- 블록: 텍스트, 선택지, 환경 효과 ---
struct Block {
    std::string name;
    std::vector<std::string> text;           // 원본 라인 (조건문/색상 지시자는 실행 시점에 해석)
    std::vector<Choice> choices;
    std::map<std::string, bool> flagEffects;
    std::map<std::string, int32_t> counterEffects;
};

// --- 문서: 하나의 스토리 파일에서 파싱된 블록 목록 ---
struct Document {
    std::string name;
    std::vector<Block> blocks;

    // 이름이 같은 블록이 여러 개면 첫 번째를 반환. 없으면 nullptr.
    const Block* findBlock(const std::string& blockName) const;
    const Block* firstBlock() const { return blocks.empty() ? nullptr : &blocks.front(); }
};

// 대상이 다른 문서를 가리키는지 (접미사로만 판단, 존재 여부는 보지 않음)
bool isDocumentTarget(const std::string& target, const std::string& suffix);

} // namespace Fable
