#pragma once

#include "fable_console.h"
#include "fable_matcher.h"
#include "fable_runner.h"
#include "fable_save.h"
#include <istream>
#include <string>

namespace Fable {

// --- 플레이 세션: 입력 루프 + 제어어 (quit/save/load) ---
class Session {
public:
    enum class Answer { YES, NO, UNSURE };
    enum class Direction { NORTH, EAST, SOUTH, WEST, UP, DOWN, RETURN };

    Session(Runner& runner, SaveStore& store, const Dictionary& dictionary,
            ConsoleWriter& writer, std::istream& in);

    // 스토리 종료 또는 quit까지 진행. 반환값: 종료 코드
    int run();

    // 사전에 맞는 답이 나올 때까지 반복. quit/EOF/load 시 false.
    bool askQuestion(const std::string& prompt, Answer& outAnswer);
    bool askDirection(const std::string& prompt, Direction& outDirection);

    bool hasQuit() const { return quitting_; }

private:
    // 제어어 처리 결과
    enum class Control { NONE, HANDLED, LOADED, QUIT };

    Runner& runner_;
    SaveStore& store_;
    const Dictionary& dictionary_;
    ConsoleWriter& writer_;
    std::istream& in_;
    bool quitting_ = false;

    bool readInput(std::string& outInput);
    Control handleControl(const std::string& input);
    void promptChoice();

    bool parseAnswer(const std::string& input, Answer& outAnswer) const;
    bool parseDirection(const std::string& input, Direction& outDirection) const;
    bool askAnswer(const std::string& prompt, bool intercept, Answer& outAnswer);

    void quit(bool askToSave);
    void save();
    void load();
    void printParseResult(const std::string& input, const std::string& parsed) const;
};

} // namespace Fable
