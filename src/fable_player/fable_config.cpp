#include "fable_config.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace Fable {

bool PlayerConfig::loadFromFile(const std::string& filepath, std::string& error) {
    std::ifstream ifs(filepath);
    if (!ifs.is_open()) {
        error = "Failed to open config file: " + filepath;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)),
                        std::istreambuf_iterator<char>());
    if (!loadFromString(content, error)) {
        error = filepath + ": " + error;
        return false;
    }
    return true;
}

bool PlayerConfig::loadFromString(const std::string& jsonText, std::string& error) {
    json root;
    try {
        root = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        error = e.what();
        return false;
    }

    if (!root.is_object()) {
        error = "top-level value must be an object";
        return false;
    }

    PlayerConfig next = *this;
    try {
        next.storyRoot = root.value("storyRoot", next.storyRoot);
        next.startDocument = root.value("startDocument", next.startDocument);
        next.startBlock = root.value("startBlock", next.startBlock);
        next.identity = root.value("identity", next.identity);
        next.saveDirectory = root.value("saveDirectory", next.saveDirectory);
        next.documentSuffix = root.value("documentSuffix", next.documentSuffix);
        next.dictionaryFile = root.value("dictionaryFile", next.dictionaryFile);
        next.debug = root.value("debug", next.debug);
        next.fastMode = root.value("fastMode", next.fastMode);
        next.color = root.value("color", next.color);
        next.lineDelayMs = root.value("lineDelayMs", next.lineDelayMs);
        next.typeDelayMs = root.value("typeDelayMs", next.typeDelayMs);
        next.maxConditionDepth = root.value("maxConditionDepth", next.maxConditionDepth);
        next.maxAutoAdvance = root.value("maxAutoAdvance", next.maxAutoAdvance);
    } catch (const json::type_error& e) {
        error = e.what();
        return false;
    }

    if (next.maxConditionDepth < 1 || next.maxAutoAdvance < 1
        || next.lineDelayMs < 0 || next.typeDelayMs < 0) {
        error = "limits must be positive and delays non-negative";
        return false;
    }

    *this = next;
    return true;
}

RunnerConfig PlayerConfig::toRunnerConfig() const {
    RunnerConfig config;
    config.storyRoot = storyRoot;
    config.documentSuffix = documentSuffix;
    config.maxConditionDepth = maxConditionDepth;
    config.maxAutoAdvance = maxAutoAdvance;
    config.debug = debug;
    return config;
}

ConsoleConfig PlayerConfig::toConsoleConfig() const {
    ConsoleConfig config;
    config.fastMode = fastMode;
    config.lineDelayMs = lineDelayMs;
    config.typeDelayMs = typeDelayMs;
    config.color = color;
    return config;
}

} // namespace Fable
