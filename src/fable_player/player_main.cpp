#include "fable_config.h"
#include "fable_console.h"
#include "fable_matcher.h"
#include "fable_runner.h"
#include "fable_save.h"
#include "fable_session.h"

#include <iostream>
#include <string>
#include <cstring>

static const char* VERSION = "0.1.0";

static void printUsage() {
    std::cout << "Fable Player v" << VERSION << "\n"
              << "Usage: FablePlayer [story.txt] [options]\n"
              << "\n"
              << "Options:\n"
              << "  --block <name>       Starting block (default: start)\n"
              << "  --root <dir>         Story directory (default: resources)\n"
              << "  --config <path>      Load settings from a JSON file\n"
              << "  --identity <name>    Save slot name (default: Default)\n"
              << "  --save-dir <dir>     Save directory\n"
              << "  --dictionary <path>  Extra input dictionaries (JSON)\n"
              << "  --suffix <ext>       Document target suffix (default: .txt)\n"
              << "  --fast               Print without typing delays\n"
              << "  --no-color           Disable ANSI colors\n"
              << "  --debug              Print engine diagnostics to stderr\n"
              << "  -h, --help           Show this help message\n"
              << "  --version            Show version number\n";
}

int main(int argc, char* argv[]) {
    Fable::PlayerConfig config;

    // help/version/config 먼저 (위치 무관)
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            printUsage();
            return 0;
        }
        if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "FablePlayer " << VERSION << std::endl;
            return 0;
        }
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            std::string error;
            if (!config.loadFromFile(argv[++i], error)) {
                std::cerr << "error: " << error << std::endl;
                return 1;
            }
        }
    }

    // 명령행 덮어쓰기
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            ++i;
        } else if (std::strcmp(argv[i], "--block") == 0 && i + 1 < argc) {
            config.startBlock = argv[++i];
        } else if (std::strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            config.storyRoot = argv[++i];
        } else if (std::strcmp(argv[i], "--identity") == 0 && i + 1 < argc) {
            config.identity = argv[++i];
        } else if (std::strcmp(argv[i], "--save-dir") == 0 && i + 1 < argc) {
            config.saveDirectory = argv[++i];
        } else if (std::strcmp(argv[i], "--dictionary") == 0 && i + 1 < argc) {
            config.dictionaryFile = argv[++i];
        } else if (std::strcmp(argv[i], "--suffix") == 0 && i + 1 < argc) {
            config.documentSuffix = argv[++i];
        } else if (std::strcmp(argv[i], "--fast") == 0) {
            config.fastMode = true;
        } else if (std::strcmp(argv[i], "--no-color") == 0) {
            config.color = false;
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            config.debug = true;
        } else if (argv[i][0] != '-') {
            config.startDocument = argv[i];
        } else {
            std::cerr << "warning: unknown option " << argv[i] << std::endl;
        }
    }

    // 사전
    Fable::Dictionary dictionary = Fable::Dictionary::withDefaults();
    if (!config.dictionaryFile.empty() && !dictionary.loadFromFile(config.dictionaryFile)) {
        std::cerr << "error: " << dictionary.getError() << std::endl;
        return 1;
    }

    Fable::Runner runner(config.toRunnerConfig());
    runner.setDictionary(&dictionary);
    runner.environment().setIdentity(config.identity);

    if (!runner.start(config.startDocument, config.startBlock)) {
        std::cerr << "error: Couldn't start story: " << config.startDocument;
        if (!runner.getLastError().empty()) {
            std::cerr << " (" << runner.getLastError() << ")";
        }
        std::cerr << std::endl;
        return 1;
    }

    Fable::SaveStore store(config.saveDirectory);
    Fable::ConsoleWriter writer(std::cout, config.toConsoleConfig());
    Fable::Session session(runner, store, dictionary, writer, std::cin);

    return session.run();
}
