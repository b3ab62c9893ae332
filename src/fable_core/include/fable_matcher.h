#pragma once
#include "fable_story.h"
#include <string>
#include <vector>
#include <map>
#include <set>

namespace Fable {

// --- 사전: 이름 붙은 입력 문구 집합 ---
class Dictionary {
public:
    static constexpr char MARKER = '@';

    // 기본 사전 (AFFIRMATIVES, NEGATIVES, ..., EXITS, SAVES, LOADS)
    static Dictionary withDefaults();

    bool isMember(const std::string& dictionaryName, const std::string& normalizedText) const;
    bool hasDictionary(const std::string& dictionaryName) const;
    void set(const std::string& dictionaryName, const std::vector<std::string>& phrases);
    std::vector<std::string> getNames() const;

    // JSON 파일 병합 ({ "NAME": ["phrase", ...] }). 같은 이름은 교체.
    bool loadFromFile(const std::string& filepath);
    bool loadFromString(const std::string& jsonText, const std::string& sourceName = "<string>");

    const std::string& getError() const { return error_; }

private:
    std::map<std::string, std::set<std::string>> sets_;
    std::string error_;
};

// 입력 정규화: 문자/숫자/공백만 남기고 trim 후 소문자화
std::string sanitize(const std::string& raw);

// --- 입력 매처 ---
class InputMatcher {
public:
    explicit InputMatcher(const Dictionary* dictionary = nullptr) : dictionary_(dictionary) {}

    void setDictionary(const Dictionary* dictionary) { dictionary_ = dictionary; }

    // ordinal: 표시된 선택지 중 1부터 시작하는 순번
    bool matches(const Choice& choice, const std::string& sanitizedInput, int ordinal) const;

private:
    const Dictionary* dictionary_;

    bool matchesDictionary(const std::string& keywords, const std::string& input) const;
};

} // namespace Fable
