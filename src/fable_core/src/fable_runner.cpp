#include "fable_runner.h"
#include "fable_parser.h"
#include <filesystem>
#include <iostream>

namespace Fable {

const char* endReasonName(EndReason reason) {
    switch (reason) {
        case EndReason::NONE:               return "None";
        case EndReason::STORY_END:          return "StoryEnd";
        case EndReason::BLOCK_NOT_FOUND:    return "BlockNotFound";
        case EndReason::TARGET_NOT_FOUND:   return "TargetNotFound";
        case EndReason::DOCUMENT_NOT_FOUND: return "DocumentNotFound";
        case EndReason::MALFORMED_DOCUMENT: return "MalformedDocument";
        case EndReason::AUTO_ADVANCE_LIMIT: return "AutoAdvanceLimit";
        case EndReason::GAME_OVER:          return "GameOver";
    }
    return "Unknown";
}

Runner::Runner() : Runner(RunnerConfig()) {}

Runner::Runner(const RunnerConfig& config)
    : config_(config), resolver_(config.maxConditionDepth) {}

void Runner::addDocumentSource(const std::string& name, const std::string& source) {
    sources_[name] = source;
}

std::string Runner::getCurrentBlockName() const {
    return block_ ? block_->name : std::string();
}

// --- 문서 로드 ---
bool Runner::loadDocument(const std::string& name, Document& outDoc, EndReason& failure) {
    Parser parser(config_.maxConditionDepth);

    bool ok;
    auto it = sources_.find(name);
    if (it != sources_.end()) {
        ok = parser.parseString(it->second, name);
    } else {
        std::string path = config_.storyRoot.empty()
            ? name
            : (std::filesystem::path(config_.storyRoot) / name).string();
        ok = parser.parse(path);
    }

    if (!ok) {
        if (parser.isFileNotFound()) {
            failure = EndReason::DOCUMENT_NOT_FOUND;
            lastError_ = "Document not found: " + name;
            std::cerr << "[Fable] " << lastError_ << std::endl;
        } else {
            failure = EndReason::MALFORMED_DOCUMENT;
            lastError_ = parser.getError();
            for (const auto& err : parser.getErrors()) {
                std::cerr << "[Fable] error: " << err << std::endl;
            }
        }
        return false;
    }

    if (config_.debug) {
        for (const auto& warn : parser.getWarnings()) {
            std::cerr << "[Fable] warning: " << warn << std::endl;
        }
    }

    outDoc = parser.takeDocument();
    outDoc.name = name;
    return true;
}

// --- 시작 / 재개 ---
bool Runner::start(const std::string& documentName, const std::string& blockName) {
    lastError_.clear();
    endReason_ = EndReason::NONE;
    presented_.clear();
    block_ = nullptr;
    skipEffects_ = false;

    Document doc;
    EndReason failure = EndReason::NONE;
    if (!loadDocument(documentName, doc, failure)) {
        phase_ = Phase::FINISHED;
        endReason_ = failure;
        return false;
    }
    document_ = std::move(doc);

    // 블록 이름이 비어 있으면 첫 블록
    const Block* block = blockName.empty()
        ? document_.firstBlock()
        : document_.findBlock(blockName);
    env_.setPosition(document_.name, blockName);
    if (!block) {
        lastError_ = "No block found with the name " + blockName;
        std::cerr << "[Fable] " << lastError_ << std::endl;
        finish(EndReason::BLOCK_NOT_FOUND);
        return true;
    }

    enterBlock(*block);
    return true;
}

bool Runner::resume(const Environment& env) {
    const Position position = env.getPosition();

    // 저장 위치를 먼저 확인. 실패하면 현재 진행 상태는 그대로 둔다
    Document doc;
    EndReason failure = EndReason::NONE;
    if (!loadDocument(position.document, doc, failure)) {
        return false;
    }
    const Block* block = position.block.empty()
        ? doc.firstBlock()
        : doc.findBlock(position.block);
    if (!block) {
        lastError_ = "No block found with the name " + position.block
            + " in " + position.document;
        std::cerr << "[Fable] " << lastError_ << std::endl;
        return false;
    }
    const std::string blockName = block->name;

    env_ = env;
    document_ = std::move(doc);
    lastError_.clear();
    endReason_ = EndReason::NONE;
    enterBlock(*document_.findBlock(blockName));
    // 이미 적용된 효과는 다시 적용하지 않는다
    skipEffects_ = true;
    return true;
}

// --- 블록 진입 ---
void Runner::enterBlock(const Block& block) {
    block_ = &block;
    pc_ = 0;
    phase_ = Phase::RENDERING;
    presented_.clear();
    env_.setPosition(document_.name, block.name);

    if (config_.debug) {
        std::cerr << "[Fable] Enter block: " << document_.name
                  << " / " << block.name << std::endl;
    }
}

void Runner::applyEffects(const Block& block) {
    for (const auto& pair : block.flagEffects) {
        env_.setFlag(pair.first, pair.second);
    }
    for (const auto& pair : block.counterEffects) {
        env_.updateCounter(pair.first, pair.second);
    }
}

// 조건이 거짓인 선택지는 제거 (선택지에는 else 분기가 없다)
// 라벨은 색상 지시자를 뗀 표시 텍스트로 바뀐다
void Runner::filterChoices(const Block& block) {
    presented_.clear();
    for (const auto& choice : block.choices) {
        std::string label;
        if (resolver_.resolveLabel(choice.label, env_, label)) {
            Choice visible = choice;
            visible.label = label;
            presented_.push_back(std::move(visible));
        }
    }
}

void Runner::followTarget(std::string target) {
    if (isDocumentTarget(target, config_.documentSuffix)) {
        Document next;
        EndReason failure = EndReason::NONE;
        if (!loadDocument(target, next, failure)) {
            finish(failure);
            return;
        }
        document_ = std::move(next);
        env_.setFlag(Environment::SAVED_FLAG, false);
        const Block* first = document_.firstBlock();
        if (!first) {
            lastError_ = "Document has no blocks: " + target;
            std::cerr << "[Fable] " << lastError_ << std::endl;
            env_.setPosition(document_.name, "");
            finish(EndReason::BLOCK_NOT_FOUND);
            return;
        }
        enterBlock(*first);
        return;
    }

    const Block* next = document_.findBlock(target);
    if (!next) {
        lastError_ = "Can't find block: " + target;
        std::cerr << "[Fable] " << lastError_ << std::endl;
        finish(EndReason::TARGET_NOT_FOUND);
        return;
    }
    env_.setFlag(Environment::SAVED_FLAG, false);
    enterBlock(*next);
}

void Runner::finish(EndReason reason) {
    phase_ = Phase::FINISHED;
    endReason_ = reason;
    block_ = nullptr;
    presented_.clear();
}

void Runner::fillChoices(StepResult& result) const {
    result.type = StepType::CHOICES;
    result.choices.clear();
    for (size_t i = 0; i < presented_.size(); ++i) {
        ChoiceData cd;
        cd.text = presented_[i].label;
        cd.index = static_cast<int>(i);
        result.choices.push_back(std::move(cd));
    }
}

// =================================================================
// step(): 다음 출력이 생길 때까지 진행
// =================================================================
StepResult Runner::step() {
    StepResult result;
    int silentHops = 0;

    while (true) {
        if (phase_ == Phase::FINISHED) {
            result.type = StepType::END;
            result.endReason = endReason_;
            return result;
        }

        if (phase_ == Phase::AWAITING_CHOICE) {
            fillChoices(result);
            return result;
        }

        // 1. 텍스트 렌더링 (블록 진입 시점의 환경으로 해석)
        const Block& block = *block_;
        while (pc_ < block.text.size()) {
            const std::string& raw = block.text[pc_++];
            RenderLine line;
            if (resolver_.resolve(raw, env_, line)) {
                result.type = StepType::LINE;
                result.line = std::move(line);
                return result;
            }
        }

        // 2. 효과 적용
        if (!skipEffects_) {
            applyEffects(block);
        }
        skipEffects_ = false;

        if (env_.getFlag(Environment::GAME_OVER_FLAG)) {
            finish(EndReason::GAME_OVER);
            continue;
        }

        // 3. 선택지 필터링
        filterChoices(block);

        // 4. 분기
        if (presented_.empty()) {
            finish(EndReason::STORY_END);
            continue;
        }

        if (presented_.size() == 1) {
            // 자동 진행
            if (++silentHops > config_.maxAutoAdvance) {
                lastError_ = "Too many automatic transitions without output (last block: "
                    + block.name + ")";
                std::cerr << "[Fable] " << lastError_ << std::endl;
                finish(EndReason::AUTO_ADVANCE_LIMIT);
                continue;
            }
            followTarget(presented_.front().target);
            continue;
        }

        phase_ = Phase::AWAITING_CHOICE;
    }
}

// =================================================================
// 선택
// =================================================================
bool Runner::choose(const std::string& sanitizedInput) {
    if (phase_ != Phase::AWAITING_CHOICE || sanitizedInput.empty()) return false;

    for (size_t i = 0; i < presented_.size(); ++i) {
        if (matcher_.matches(presented_[i], sanitizedInput, static_cast<int>(i) + 1)) {
            if (config_.debug) {
                std::cerr << "[Fable] Input: " << sanitizedInput
                          << ", Parsed: Choice->" << presented_[i].target << std::endl;
            }
            followTarget(presented_[i].target);
            return true;
        }
    }

    if (config_.debug) {
        std::cerr << "[Fable] Input: " << sanitizedInput << ", Parsed: Choice->None" << std::endl;
    }
    return false;
}

void Runner::choose(int index) {
    if (phase_ != Phase::AWAITING_CHOICE) return;
    if (index < 0 || index >= static_cast<int>(presented_.size())) return;
    followTarget(presented_[static_cast<size_t>(index)].target);
}

} // namespace Fable
