#include "fable_matcher.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <cctype>
#include <iterator>

using json = nlohmann::json;

namespace Fable {

// =================================================================
// 기본 사전
// =================================================================
Dictionary Dictionary::withDefaults() {
    Dictionary dict;
    dict.set("AFFIRMATIVES", {
        "10-4", "affirmative", "alright", "aye", "hell yeah", "hell yes", "ok", "okay",
        "please", "positive", "sure", "y", "yay", "ye", "yeah", "yeah ok", "yeah sure",
        "yep", "yes", "yes please", "yup"
    });
    dict.set("NEGATIVES", {
        "hell nah", "hell no", "n", "nah", "nay", "negative", "never", "no", "nope",
        "no please", "not ok", "not okay", "no way"
    });
    dict.set("UNSURATIVES", {
        "dunno", "huh", "idk", "i dont know", "i dunno", "i guess", "maybe", "no clue",
        "no idea", "not sure", "que", "shrug", "unsure", "what"
    });
    dict.set("NORTHS", {
        "forward", "go forward", "go north", "n", "north", "northbound", "northward"
    });
    dict.set("EASTS", {
        "e", "east", "eastbound", "eastward", "go east", "go right", "right"
    });
    dict.set("SOUTHS", {
        "backward", "go backward", "go south", "s", "south", "southbound", "southward"
    });
    dict.set("WESTS", {
        "go left", "go west", "left", "w", "west", "westbound", "westward"
    });
    dict.set("UPS", {
        "ascend", "climb", "climb up", "fly", "fly up", "go up", "rise", "u", "up"
    });
    dict.set("DOWNS", {
        "climb down", "d", "descend", "down", "fall", "glide", "go down"
    });
    dict.set("RETURNS", {
        "b", "back", "fall back", "go back", "r", "retreat", "return", "run", "run away"
    });
    dict.set("EXITS", {"exit", "exit game", "quit", "quit game"});
    dict.set("SAVES", {"save", "save game"});
    dict.set("LOADS", {"load", "load game"});
    return dict;
}

bool Dictionary::isMember(const std::string& dictionaryName,
                          const std::string& normalizedText) const {
    auto it = sets_.find(dictionaryName);
    if (it == sets_.end()) return false;
    return it->second.count(normalizedText) > 0;
}

bool Dictionary::hasDictionary(const std::string& dictionaryName) const {
    return sets_.find(dictionaryName) != sets_.end();
}

// 문구는 입력과 같은 방식으로 정규화해 저장
void Dictionary::set(const std::string& dictionaryName, const std::vector<std::string>& phrases) {
    std::set<std::string> normalized;
    for (const auto& phrase : phrases) {
        normalized.insert(sanitize(phrase));
    }
    sets_[dictionaryName] = std::move(normalized);
}

std::vector<std::string> Dictionary::getNames() const {
    std::vector<std::string> names;
    for (const auto& pair : sets_) {
        names.push_back(pair.first);
    }
    return names;
}

// =================================================================
// JSON 로드
// =================================================================
bool Dictionary::loadFromFile(const std::string& filepath) {
    std::ifstream ifs(filepath);
    if (!ifs.is_open()) {
        error_ = "Failed to open dictionary file: " + filepath;
        std::cerr << "[Fable] " << error_ << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)),
                        std::istreambuf_iterator<char>());
    return loadFromString(content, filepath);
}

bool Dictionary::loadFromString(const std::string& jsonText, const std::string& sourceName) {
    error_.clear();

    json root;
    try {
        root = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        error_ = sourceName + ": " + e.what();
        std::cerr << "[Fable] Invalid dictionary JSON: " << error_ << std::endl;
        return false;
    }

    if (!root.is_object()) {
        error_ = sourceName + ": top-level value must be an object";
        std::cerr << "[Fable] " << error_ << std::endl;
        return false;
    }

    // 전부 검증한 뒤에 병합 (부분 적용 없음)
    std::map<std::string, std::vector<std::string>> loaded;
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!it.value().is_array()) {
            error_ = sourceName + ": '" + it.key() + "' must be an array of strings";
            std::cerr << "[Fable] " << error_ << std::endl;
            return false;
        }
        std::vector<std::string> phrases;
        for (const auto& item : it.value()) {
            if (!item.is_string()) {
                error_ = sourceName + ": '" + it.key() + "' must be an array of strings";
                std::cerr << "[Fable] " << error_ << std::endl;
                return false;
            }
            phrases.push_back(item.get<std::string>());
        }
        loaded[it.key()] = std::move(phrases);
    }

    for (const auto& pair : loaded) {
        set(pair.first, pair.second);
    }
    return true;
}

// =================================================================
// 입력 정규화
// =================================================================
std::string sanitize(const std::string& raw) {
    std::string filtered;
    filtered.reserve(raw.size());
    for (char ch : raw) {
        unsigned char c = static_cast<unsigned char>(ch);
        // UTF-8 멀티바이트 문자는 그대로 유지
        if (std::isalnum(c) || c == ' ' || c >= 0x80) {
            filtered += static_cast<char>(std::tolower(c));
        }
    }

    size_t start = filtered.find_first_not_of(' ');
    if (start == std::string::npos) return "";
    size_t end = filtered.find_last_not_of(' ');
    return filtered.substr(start, end - start + 1);
}

// =================================================================
// 매칭
// =================================================================
bool InputMatcher::matches(const Choice& choice, const std::string& sanitizedInput,
                           int ordinal) const {
    if (sanitizedInput.empty()) return false;

    return sanitize(choice.label) == sanitizedInput
        || choice.target == sanitizedInput
        || std::to_string(ordinal) == sanitizedInput
        || choice.keywords.find(sanitizedInput) != std::string::npos
        || matchesDictionary(choice.keywords, sanitizedInput);
}

// 1단계: 마커 검사, 2단계: 사전 이름으로 조회
bool InputMatcher::matchesDictionary(const std::string& keywords, const std::string& input) const {
    if (!dictionary_ || keywords.empty() || keywords[0] != Dictionary::MARKER) return false;

    size_t end = keywords.find_last_not_of(" \t");
    std::string name = keywords.substr(1, end);
    return dictionary_->isMember(name, input);
}

} // namespace Fable
