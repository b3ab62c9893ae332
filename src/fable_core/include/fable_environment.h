#pragma once
#include <string>
#include <map>
#include <cstdint>
#include <ostream>

namespace Fable {

// 현재 위치 (문서 이름, 블록 이름)
struct Position {
    std::string document;
    std::string block;

    bool operator==(const Position& other) const {
        return document == other.document && block == other.block;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

// --- 플레이 상태: flag/counter 저장소 + 현재 위치 ---
// 설정되지 않은 flag는 false, counter는 0으로 읽힌다.
class Environment {
public:
    static constexpr const char* SCORE = "score";
    static constexpr const char* SAVED_FLAG = "saved"; // 저장되지 않은 진행 여부
    static constexpr const char* GAME_OVER_FLAG = "game_over"; // 켜지면 게임 종료

    explicit Environment(const std::string& identity = "Default");

    const std::string& getIdentity() const { return identity_; }
    void setIdentity(const std::string& identity) { identity_ = identity; }

    // Flag API
    bool getFlag(const std::string& name) const;
    void setFlag(const std::string& name, bool value);

    // Counter API (가산 방식)
    int32_t getCounter(const std::string& name) const;
    void updateCounter(const std::string& name, int32_t delta);
    void addScore(int32_t delta) { updateCounter(SCORE, delta); }

    // 위치
    const Position& getPosition() const { return position_; }
    void setPosition(const std::string& document, const std::string& block);
    void setBlock(const std::string& block) { position_.block = block; }

    const std::map<std::string, bool>& getFlags() const { return flags_; }
    const std::map<std::string, int32_t>& getCounters() const { return counters_; }

    // 저장 파일 복원용: 기본 score 시드 없이 전체 교체
    void clear();

    bool operator==(const Environment& other) const;
    bool operator!=(const Environment& other) const { return !(*this == other); }

    // 디버그 덤프 (Name / Progress / Flags / Counters)
    void print(std::ostream& out) const;

private:
    std::string identity_;
    Position position_;
    std::map<std::string, bool> flags_;
    std::map<std::string, int32_t> counters_;
};

std::ostream& operator<<(std::ostream& out, const Environment& env);

} // namespace Fable
