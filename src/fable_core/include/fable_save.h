#pragma once
#include "fable_environment.h"
#include <string>
#include <vector>
#include <cstdint>

namespace Fable {

// --- Environment 영속화 (.fsav, FlatBuffers) ---
class SaveStore {
public:
    enum class LoadResult { OK, NOT_FOUND, INVALID };

    static constexpr const char* FORMAT_VERSION = "1.0";
    static constexpr const char* EXTENSION = ".fsav";

    // 디렉터리가 비어 있으면 기본 경로 ($XDG_DATA_HOME/fable 또는 ~/.local/share/fable)
    explicit SaveStore(const std::string& directory = "");

    bool save(const Environment& env) const;
    LoadResult load(const std::string& identity, Environment& outEnv) const;
    bool exists(const std::string& identity) const;

    // identity → 저장 파일 경로
    std::string pathFor(const std::string& identity) const;
    const std::string& getDirectory() const { return directory_; }

    // 메모리 버퍼 직렬화 (파일 없이 사용)
    static std::vector<uint8_t> serialize(const Environment& env);
    static bool deserialize(const uint8_t* buffer, size_t size, Environment& outEnv);

    static std::string defaultDirectory();

private:
    std::string directory_;
};

} // namespace Fable
