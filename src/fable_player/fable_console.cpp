#include "fable_console.h"

#include <chrono>
#include <thread>

namespace Fable {

// --- ANSI 색상 코드 ---
static const char* RESET  = "\033[0m";
static const char* RED    = "\033[31m";
static const char* GREEN  = "\033[32m";
static const char* YELLOW = "\033[33m";
static const char* BLUE   = "\033[34m";
static const char* PURPLE = "\033[35m";
static const char* CYAN   = "\033[36m";

const char* ConsoleWriter::colorCode(Highlight highlight) {
    switch (highlight) {
        case Highlight::YELLOW: return YELLOW;
        case Highlight::BLUE:   return BLUE;
        case Highlight::GREEN:  return GREEN;
        case Highlight::RED:    return RED;
        case Highlight::CYAN:   return CYAN;
        case Highlight::PURPLE: return PURPLE;
        case Highlight::DEFAULT: break;
    }
    return "";
}

// UTF-8 선두 바이트 → 코드 포인트 길이
static size_t utf8Length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

ConsoleWriter::ConsoleWriter(std::ostream& out, const ConsoleConfig& config)
    : out_(out), config_(config), rng_(std::random_device{}()), jitter_(0.0, 1.0) {}

void ConsoleWriter::nap(double milliseconds) {
    if (config_.fastMode || milliseconds <= 0.0) return;
    std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(milliseconds));
}

void ConsoleWriter::typeSpans(const std::vector<TextSpan>& spans, bool fast) {
    bool wrote = false;
    for (const auto& span : spans) {
        const char* code = config_.color ? colorCode(span.highlight) : "";
        size_t i = 0;
        while (i < span.text.size()) {
            size_t len = utf8Length(static_cast<unsigned char>(span.text[i]));
            if (i + len > span.text.size()) len = span.text.size() - i;

            if (*code) out_ << code;
            out_.write(span.text.data() + i, static_cast<std::streamsize>(len));
            if (*code) out_ << RESET;
            out_.flush();

            nap(config_.typeDelayMs * (jitter_(rng_) + 0.25));
            i += len;
            wrote = true;
        }
    }

    // 빈 줄은 출력하지 않는다
    if (!wrote) return;

    nap(fast ? config_.lineDelayMs / 2.0 : config_.lineDelayMs);
    out_ << "\n";
    out_.flush();
}

void ConsoleWriter::writeLine(const RenderLine& line) {
    if (line.question) {
        blankLine();
    }
    if (line.spans.empty()) {
        typeSpans({TextSpan{line.text, line.highlight}}, false);
    } else {
        typeSpans(line.spans, false);
    }
}

void ConsoleWriter::typeText(const std::string& text, Highlight highlight, bool fast) {
    typeSpans(Resolver::splitQuotes(text, highlight), fast);
}

void ConsoleWriter::writeChoices(const std::vector<ChoiceData>& choices) {
    for (const auto& choice : choices) {
        typeText(std::to_string(choice.index + 1) + ") " + choice.text,
                 Highlight::DEFAULT, true);
    }
}

void ConsoleWriter::blankLine() {
    out_ << "\n";
    out_.flush();
}

} // namespace Fable
