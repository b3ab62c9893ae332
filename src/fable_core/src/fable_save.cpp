#include "fable_save.h"
#include "fable_generated.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <cstdlib>
#include <memory>

using namespace Fable::Schema;

namespace Fable {

SaveStore::SaveStore(const std::string& directory)
    : directory_(directory.empty() ? defaultDirectory() : directory) {}

std::string SaveStore::defaultDirectory() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME")) {
        if (*xdg) return std::string(xdg) + "/fable";
    }
    if (const char* home = std::getenv("HOME")) {
        if (*home) return std::string(home) + "/.local/share/fable";
    }
    return "saves";
}

std::string SaveStore::pathFor(const std::string& identity) const {
    // 경로 구분자는 파일 이름에 쓰지 않는다
    std::string fileName = identity;
    for (auto& c : fileName) {
        if (c == '/' || c == '\\') c = '_';
    }
    if (fileName.empty()) fileName = "Default";
    return (std::filesystem::path(directory_) / (fileName + EXTENSION)).string();
}

bool SaveStore::exists(const std::string& identity) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(pathFor(identity), ec);
}

// =================================================================
// 직렬화
// =================================================================
std::vector<uint8_t> SaveStore::serialize(const Environment& env) {
    SaveStateT state;
    state.version = FORMAT_VERSION;
    state.identity = env.getIdentity();
    state.document_name = env.getPosition().document;
    state.block_name = env.getPosition().block;

    for (const auto& pair : env.getFlags()) {
        auto flag = std::make_unique<SavedFlagT>();
        flag->name = pair.first;
        flag->value = pair.second;
        state.flags.push_back(std::move(flag));
    }

    for (const auto& pair : env.getCounters()) {
        auto counter = std::make_unique<SavedCounterT>();
        counter->name = pair.first;
        counter->value = pair.second;
        state.counters.push_back(std::move(counter));
    }

    flatbuffers::FlatBufferBuilder fbb;
    auto offset = SaveState::Pack(fbb, &state);
    FinishSaveStateBuffer(fbb, offset);

    const uint8_t* data = fbb.GetBufferPointer();
    return std::vector<uint8_t>(data, data + fbb.GetSize());
}

bool SaveStore::deserialize(const uint8_t* buffer, size_t size, Environment& outEnv) {
    if (!buffer || size == 0) return false;

    flatbuffers::Verifier verifier(buffer, size);
    if (!VerifySaveStateBuffer(verifier)) {
        return false;
    }

    const auto* saved = GetSaveState(buffer);

    Environment env(saved->identity() ? saved->identity()->str() : "");
    env.clear();
    env.setPosition(saved->document_name() ? saved->document_name()->str() : "",
                    saved->block_name() ? saved->block_name()->str() : "");

    if (const auto* flags = saved->flags()) {
        for (flatbuffers::uoffset_t i = 0; i < flags->size(); ++i) {
            const auto* flag = flags->Get(i);
            if (!flag->name()) continue;
            env.setFlag(flag->name()->str(), flag->value());
        }
    }

    if (const auto* counters = saved->counters()) {
        for (flatbuffers::uoffset_t i = 0; i < counters->size(); ++i) {
            const auto* counter = counters->Get(i);
            if (!counter->name()) continue;
            env.updateCounter(counter->name()->str(), counter->value());
        }
    }

    outEnv = std::move(env);
    return true;
}

// =================================================================
// 파일 저장/로드
// =================================================================
bool SaveStore::save(const Environment& env) const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        std::cerr << "[Fable] Cannot create save directory: " << directory_
                  << " (" << ec.message() << ")" << std::endl;
        return false;
    }

    auto buffer = serialize(env);
    std::string path = pathFor(env.getIdentity());

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        std::cerr << "[Fable] Cannot open save file: " << path << std::endl;
        return false;
    }
    ofs.write(reinterpret_cast<const char*>(buffer.data()),
              static_cast<std::streamsize>(buffer.size()));
    return ofs.good();
}

SaveStore::LoadResult SaveStore::load(const std::string& identity, Environment& outEnv) const {
    std::string path = pathFor(identity);

    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs) {
        return LoadResult::NOT_FOUND;
    }

    auto size = ifs.tellg();
    if (size <= 0) {
        std::cerr << "[Fable] Empty save file: " << path << std::endl;
        return LoadResult::INVALID;
    }
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(size));
    if (!ifs.read(reinterpret_cast<char*>(buf.data()), size)) {
        std::cerr << "[Fable] Failed to read save file: " << path << std::endl;
        return LoadResult::INVALID;
    }

    if (!deserialize(buf.data(), buf.size(), outEnv)) {
        std::cerr << "[Fable] Invalid save file: " << path << std::endl;
        return LoadResult::INVALID;
    }
    return LoadResult::OK;
}

} // namespace Fable
