#include "fable_parser.h"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdint>

namespace Fable {

// --- 유틸리티 ---
void Parser::addError(int lineNum, const std::string& msg) {
    std::string formatted = filename_ + ":" + std::to_string(lineNum) + ": " + msg;
    errors_.push_back(formatted);
    if (error_.empty()) {
        error_ = formatted;
    }
    ParseError pe;
    pe.kind = ParseError::MALFORMED_DIRECTIVE;
    pe.line = lineNum;
    pe.reason = msg;
    parseErrors_.push_back(pe);
}

void Parser::addWarning(int lineNum, const std::string& msg) {
    warnings_.push_back(filename_ + ":" + std::to_string(lineNum) + ": " + msg);
}

std::string Parser::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool Parser::startsWith(const std::string& text, const char* prefix) {
    return text.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// =================================================================
// 라인별 파서
// =================================================================

// :- name
bool Parser::parseBlockLine(const std::string& line, int lineNum) {
    if (line.size() < 3 || line[2] != ' ') {
        addError(lineNum, "expected a space after ':-'");
        return false;
    }
    std::string name = trim(line.substr(3));
    if (name.empty()) {
        addError(lineNum, "missing block name after ':-'");
        return false;
    }

    if (seenFirstBlock_) {
        document_.blocks.push_back(std::move(currentBlock_));
    } else {
        // 첫 블록 이전 내용은 버려진다
        bool hasContent = !currentBlock_.choices.empty()
            || !currentBlock_.flagEffects.empty()
            || !currentBlock_.counterEffects.empty();
        for (const auto& text : currentBlock_.text) {
            if (!trim(text).empty()) hasContent = true;
        }
        if (hasContent) {
            addWarning(lineNum, "content before the first block is ignored");
        }
        seenFirstBlock_ = true;
    }

    currentBlock_ = Block();
    currentBlock_.name = name;
    return true;
}

// =- name = true|false
bool Parser::parseFlagLine(const std::string& line, int lineNum) {
    if (line.size() < 3 || line[2] != ' ') {
        addError(lineNum, "expected a space after '=-'");
        return false;
    }
    std::string rest = line.substr(3);
    size_t eq = rest.find(" = ");
    if (eq == std::string::npos) {
        addError(lineNum, "flag effect must be '=- name = true|false'");
        return false;
    }

    std::string name = trim(rest.substr(0, eq));
    std::string value = trim(rest.substr(eq + 3));
    if (name.empty()) {
        addError(lineNum, "missing flag name after '=-'");
        return false;
    }

    bool flagValue;
    if (value == "true") {
        flagValue = true;
    } else if (value == "false") {
        flagValue = false;
    } else {
        addError(lineNum, "expected 'true' or 'false', got '" + value + "'");
        return false;
    }

    if (currentBlock_.flagEffects.count(name)) {
        addWarning(lineNum, "flag '" + name + "' is set more than once in block '"
                   + currentBlock_.name + "' (last value wins)");
    }
    currentBlock_.flagEffects[name] = flagValue;
    return true;
}

// +- name + int
bool Parser::parseCounterLine(const std::string& line, int lineNum) {
    if (line.size() < 3 || line[2] != ' ') {
        addError(lineNum, "expected a space after '+-'");
        return false;
    }
    std::string rest = line.substr(3);
    size_t plus = rest.find(" + ");
    if (plus == std::string::npos) {
        addError(lineNum, "counter effect must be '+- name + int'");
        return false;
    }

    std::string name = trim(rest.substr(0, plus));
    std::string value = trim(rest.substr(plus + 3));
    if (name.empty()) {
        addError(lineNum, "missing counter name after '+-'");
        return false;
    }

    char* end = nullptr;
    long delta = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || end == value.c_str() || *end != '\0') {
        addError(lineNum, "expected integer counter delta, got '" + value + "'");
        return false;
    }
    if (delta < INT32_MIN || delta > INT32_MAX) {
        addError(lineNum, "counter delta out of range: " + value);
        return false;
    }

    if (currentBlock_.counterEffects.count(name)) {
        addWarning(lineNum, "counter '" + name + "' is changed more than once in block '"
                   + currentBlock_.name + "' (last value wins)");
    }
    currentBlock_.counterEffects[name] = static_cast<int32_t>(delta);
    return true;
}

// *- label -> keywords -> target
bool Parser::parseChoiceLine(const std::string& line, int lineNum) {
    if (line.size() < 3 || line[2] != ' ') {
        addError(lineNum, "expected a space after '*-'");
        return false;
    }

    std::vector<std::string> parts;
    std::string rest = line.substr(3);
    size_t pos = 0;
    while (true) {
        size_t arrow = rest.find(" -> ", pos);
        if (arrow == std::string::npos) {
            parts.push_back(rest.substr(pos));
            break;
        }
        parts.push_back(rest.substr(pos, arrow - pos));
        pos = arrow + 4;
    }

    if (parts.size() != 3) {
        addError(lineNum, "choice must be '*- label -> keywords -> target'");
        return false;
    }

    Choice choice;
    choice.label = parts[0];
    choice.keywords = parts[1];
    choice.target = trim(parts[2]);
    if (choice.target.empty()) {
        addError(lineNum, "missing choice target");
        return false;
    }

    // 조건부 라벨 형식 검증
    if (Resolver::isConditional(choice.label)) {
        std::unique_ptr<TextNode> node;
        std::string error;
        if (!resolver_.compile(choice.label, node, error)) {
            addError(lineNum, "in choice label: " + error);
            return false;
        }
    }

    currentBlock_.choices.push_back(std::move(choice));
    return true;
}

// -> target
bool Parser::parseJumpLine(const std::string& line, int lineNum) {
    if (line.size() < 3 || line[2] != ' ') {
        addError(lineNum, "expected a space after '->'");
        return false;
    }
    std::string target = trim(line.substr(3));
    if (target.empty()) {
        addError(lineNum, "missing target after '->'");
        return false;
    }

    Choice choice;
    choice.target = target;
    currentBlock_.choices.push_back(std::move(choice));
    return true;
}

// 일반 텍스트 (조건문은 형식만 검증하고 원본 그대로 저장)
bool Parser::parseTextLine(const std::string& line, int lineNum) {
    if (Resolver::isConditional(line)) {
        std::unique_ptr<TextNode> node;
        std::string error;
        if (!resolver_.compile(line, node, error)) {
            addError(lineNum, error);
            return false;
        }
    }
    currentBlock_.text.push_back(line);
    return true;
}

void Parser::parseLine(std::string line, int lineNum) {
    // BOM 제거 (UTF-8 BOM)
    if (lineNum == 1 && line.size() >= 3 &&
        line[0] == '\xEF' && line[1] == '\xBB' && line[2] == '\xBF') {
        line = line.substr(3);
    }

    // CR 제거
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (startsWith(line, ":-")) {
        parseBlockLine(line, lineNum);
    } else if (startsWith(line, "=-")) {
        parseFlagLine(line, lineNum);
    } else if (startsWith(line, "+-")) {
        parseCounterLine(line, lineNum);
    } else if (startsWith(line, "*-")) {
        parseChoiceLine(line, lineNum);
    } else if (startsWith(line, "->")) {
        parseJumpLine(line, lineNum);
    } else {
        parseTextLine(line, lineNum);
    }
}

// =================================================================
// 메인 파서
// =================================================================
void Parser::reset(const std::string& name) {
    filename_ = name;
    document_ = Document();
    document_.name = name;
    currentBlock_ = Block();
    seenFirstBlock_ = false;
    error_.clear();
    errors_.clear();
    parseErrors_.clear();
    warnings_.clear();
}

void Parser::finish() {
    // 마지막 블록은 무조건 봉인 (블록 시작이 없었으면 이름 없는 블록 하나)
    document_.blocks.push_back(std::move(currentBlock_));
    currentBlock_ = Block();
}

bool Parser::parse(const std::string& filepath) {
    reset(filepath);

    std::ifstream ifs(filepath);
    if (!ifs.is_open()) {
        error_ = "Failed to open file: " + filepath;
        errors_.push_back(error_);
        ParseError pe;
        pe.kind = ParseError::FILE_NOT_FOUND;
        pe.reason = error_;
        parseErrors_.push_back(pe);
        document_.blocks.clear();
        return false;
    }

    std::string rawLine;
    int lineNum = 0;
    while (std::getline(ifs, rawLine)) {
        parseLine(rawLine, ++lineNum);
    }
    finish();
    return errors_.empty();
}

bool Parser::parseString(const std::string& source, const std::string& name) {
    reset(name);

    std::istringstream iss(source);
    std::string rawLine;
    int lineNum = 0;
    while (std::getline(iss, rawLine)) {
        parseLine(rawLine, ++lineNum);
    }
    finish();
    return errors_.empty();
}

bool Parser::parseLines(const std::vector<std::string>& lines, const std::string& name) {
    reset(name);

    int lineNum = 0;
    for (const auto& line : lines) {
        parseLine(line, ++lineNum);
    }
    finish();
    return errors_.empty();
}

} // namespace Fable
