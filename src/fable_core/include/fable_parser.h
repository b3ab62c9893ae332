#pragma once
#include "fable_story.h"
#include "fable_resolver.h"
#include <string>
#include <vector>

namespace Fable {

// 파싱 에러 레코드
struct ParseError {
    enum Kind { FILE_NOT_FOUND, MALFORMED_DIRECTIVE };
    Kind kind = MALFORMED_DIRECTIVE;
    int line = 0;        // 1부터 시작, FILE_NOT_FOUND는 0
    std::string reason;
};

class Parser {
public:
    Parser() = default;
    explicit Parser(int maxConditionDepth) : resolver_(maxConditionDepth) {}

    // 스토리 파일을 파싱하여 Document 생성
    bool parse(const std::string& filepath);

    // 문자열에서 직접 파싱
    bool parseString(const std::string& source, const std::string& name = "<string>");

    // 라인 목록에서 파싱
    bool parseLines(const std::vector<std::string>& lines, const std::string& name = "<lines>");

    const Document& getDocument() const { return document_; }
    Document takeDocument() { return std::move(document_); }

    // 첫 번째 에러 (하위 호환)
    const std::string& getError() const { return error_; }

    // 수집된 모든 에러 ("file:line: reason")
    const std::vector<std::string>& getErrors() const { return errors_; }
    const std::vector<ParseError>& getParseErrors() const { return parseErrors_; }
    bool hasErrors() const { return !errors_.empty(); }
    bool isFileNotFound() const {
        return !parseErrors_.empty() && parseErrors_.front().kind == ParseError::FILE_NOT_FOUND;
    }

    // 경고 (파싱은 성공)
    const std::vector<std::string>& getWarnings() const { return warnings_; }
    bool hasWarnings() const { return !warnings_.empty(); }

private:
    Document document_;
    Resolver resolver_;
    std::string error_;
    std::vector<std::string> errors_;
    std::vector<ParseError> parseErrors_;
    std::vector<std::string> warnings_;
    std::string filename_;

    // 현재 파싱 상태
    Block currentBlock_;
    bool seenFirstBlock_ = false;

    void reset(const std::string& name);
    void finish();
    void parseLine(std::string line, int lineNum);

    void addError(int lineNum, const std::string& msg);
    void addWarning(int lineNum, const std::string& msg);

    // 라인별 파서
    bool parseBlockLine(const std::string& line, int lineNum);
    bool parseFlagLine(const std::string& line, int lineNum);
    bool parseCounterLine(const std::string& line, int lineNum);
    bool parseChoiceLine(const std::string& line, int lineNum);
    bool parseJumpLine(const std::string& line, int lineNum);
    bool parseTextLine(const std::string& line, int lineNum);

    static std::string trim(const std::string& str);
    static bool startsWith(const std::string& text, const char* prefix);
};

} // namespace Fable
