#include "fable_session.h"

#include <iostream>

namespace Fable {

Session::Session(Runner& runner, SaveStore& store, const Dictionary& dictionary,
                 ConsoleWriter& writer, std::istream& in)
    : runner_(runner), store_(store), dictionary_(dictionary), writer_(writer), in_(in) {}

// =================================================================
// 메인 루프
// =================================================================
int Session::run() {
    while (!quitting_) {
        auto result = runner_.step();

        switch (result.type) {
            case StepType::LINE:
                writer_.writeLine(result.line);
                break;

            case StepType::CHOICES:
                writer_.blankLine();
                writer_.writeChoices(result.choices);
                writer_.blankLine();
                promptChoice();
                break;

            case StepType::END:
                if (result.endReason == EndReason::GAME_OVER) {
                    // 스토리가 game_over를 켜면 quit과 같이 끝난다
                    quitting_ = true;
                    writer_.typeText("See you next time!");
                    if (runner_.getConfig().debug) {
                        std::cerr << "\nGame State:\n" << runner_.environment();
                    }
                    return 0;
                }
                writer_.blankLine();
                if (result.endReason == EndReason::STORY_END) {
                    writer_.typeText("THE END");
                } else {
                    writer_.typeText("This path leads nowhere.", Highlight::RED);
                }
                if (runner_.getConfig().debug) {
                    std::cerr << "[Fable] End: " << endReasonName(result.endReason) << "\n"
                              << runner_.environment();
                }
                return 0;
        }
    }
    return 0;
}

// 선택지가 고정되거나 제어어로 상태가 바뀔 때까지 입력 반복
void Session::promptChoice() {
    while (!quitting_) {
        std::string input;
        if (!readInput(input)) return;
        if (input.empty()) continue;

        // 저장 후에는 같은 선택지를 다시 보여준다
        Control control = handleControl(input);
        if (control != Control::NONE) return;

        if (runner_.choose(input)) return;

        writer_.typeText("I didn't understand that.");
    }
}

// =================================================================
// 입력
// =================================================================
bool Session::readInput(std::string& outInput) {
    std::string raw;
    if (!std::getline(in_, raw)) {
        // EOF: 저장 질문 없이 종료
        quit(false);
        return false;
    }
    outInput = sanitize(raw);
    return true;
}

Session::Control Session::handleControl(const std::string& input) {
    if (dictionary_.isMember("EXITS", input)) {
        quit(true);
        return Control::QUIT;
    }
    if (dictionary_.isMember("SAVES", input)) {
        save();
        return Control::HANDLED;
    }
    if (dictionary_.isMember("LOADS", input)) {
        load();
        return Control::LOADED;
    }
    return Control::NONE;
}

// =================================================================
// 질문 헬퍼
// =================================================================
void Session::printParseResult(const std::string& input, const std::string& parsed) const {
    if (runner_.getConfig().debug) {
        std::cerr << "[Fable] Input: " << input << ", Parsed: " << parsed << std::endl;
    }
}

bool Session::parseAnswer(const std::string& input, Answer& outAnswer) const {
    if (dictionary_.isMember("AFFIRMATIVES", input)) {
        printParseResult(input, "Answer->Yes");
        outAnswer = Answer::YES;
        return true;
    }
    if (dictionary_.isMember("NEGATIVES", input)) {
        printParseResult(input, "Answer->No");
        outAnswer = Answer::NO;
        return true;
    }
    if (dictionary_.isMember("UNSURATIVES", input)) {
        printParseResult(input, "Answer->Unsure");
        outAnswer = Answer::UNSURE;
        return true;
    }
    printParseResult(input, "Answer->None");
    return false;
}

bool Session::parseDirection(const std::string& input, Direction& outDirection) const {
    static const struct {
        const char* dictionary;
        Direction direction;
        const char* name;
    } table[] = {
        {"NORTHS",  Direction::NORTH,  "Direction->North"},
        {"EASTS",   Direction::EAST,   "Direction->East"},
        {"SOUTHS",  Direction::SOUTH,  "Direction->South"},
        {"WESTS",   Direction::WEST,   "Direction->West"},
        {"UPS",     Direction::UP,     "Direction->Up"},
        {"DOWNS",   Direction::DOWN,   "Direction->Down"},
        {"RETURNS", Direction::RETURN, "Direction->Return"},
    };

    for (const auto& entry : table) {
        if (dictionary_.isMember(entry.dictionary, input)) {
            printParseResult(input, entry.name);
            outDirection = entry.direction;
            return true;
        }
    }
    printParseResult(input, "Direction->None");
    return false;
}

bool Session::askAnswer(const std::string& prompt, bool intercept, Answer& outAnswer) {
    while (!quitting_) {
        writer_.typeText(prompt, Highlight::CYAN, true);

        std::string input;
        if (!readInput(input)) return false;
        if (input.empty()) continue;

        if (intercept) {
            Control control = handleControl(input);
            if (control == Control::QUIT || control == Control::LOADED) return false;
            if (control == Control::HANDLED) continue;
        }

        if (parseAnswer(input, outAnswer)) return true;
        writer_.typeText("I didn't understand that.");
    }
    return false;
}

bool Session::askQuestion(const std::string& prompt, Answer& outAnswer) {
    return askAnswer(prompt, true, outAnswer);
}

bool Session::askDirection(const std::string& prompt, Direction& outDirection) {
    while (!quitting_) {
        writer_.typeText(prompt, Highlight::CYAN, true);

        std::string input;
        if (!readInput(input)) return false;
        if (input.empty()) continue;

        Control control = handleControl(input);
        if (control == Control::QUIT || control == Control::LOADED) return false;
        if (control == Control::HANDLED) continue;

        if (parseDirection(input, outDirection)) return true;
        writer_.typeText("I didn't understand that.");
    }
    return false;
}

// =================================================================
// 제어 동작
// =================================================================
void Session::quit(bool askToSave) {
    if (quitting_) return;

    if (askToSave && !runner_.environment().getFlag(Environment::SAVED_FLAG)) {
        Answer answer;
        // 저장 질문 안에서는 제어어를 다시 가로채지 않는다
        if (askAnswer("Do you want to save first?", false, answer)) {
            if (answer == Answer::YES) {
                save();
            } else if (answer == Answer::UNSURE) {
                writer_.typeText("I'll just save for you...");
                save();
            }
        }
    }

    // EOF로 askAnswer가 이미 quit을 호출했을 수 있다
    if (quitting_) return;
    quitting_ = true;

    writer_.typeText("See you next time!");
    if (runner_.getConfig().debug) {
        std::cerr << "\nGame State:\n" << runner_.environment();
    }
}

void Session::save() {
    Environment& env = runner_.environment();
    if (!store_.save(env)) {
        writer_.typeText("Couldn't save the game.", Highlight::RED);
        return;
    }
    writer_.typeText("Game Saved!");
    env.setFlag(Environment::SAVED_FLAG, true);
}

void Session::load() {
    Environment loaded;
    switch (store_.load(runner_.environment().getIdentity(), loaded)) {
        case SaveStore::LoadResult::NOT_FOUND:
            writer_.typeText("No save data found", Highlight::RED);
            return;
        case SaveStore::LoadResult::INVALID:
            writer_.typeText("Couldn't load the saved game.", Highlight::RED);
            return;
        case SaveStore::LoadResult::OK:
            break;
    }

    // 저장 위치를 열 수 없으면 현재 진행을 유지
    if (!runner_.resume(loaded)) {
        std::cerr << "[Fable] Cannot resume: " << runner_.getLastError() << std::endl;
        writer_.typeText("Couldn't load the saved game.", Highlight::RED);
        return;
    }
    writer_.typeText("Game Loaded!");
}

} // namespace Fable
