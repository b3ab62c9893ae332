#include "fable_environment.h"
#include <algorithm>

namespace Fable {

Environment::Environment(const std::string& identity)
    : identity_(identity) {
    counters_[SCORE] = 0;
}

bool Environment::getFlag(const std::string& name) const {
    auto it = flags_.find(name);
    return it != flags_.end() ? it->second : false;
}

void Environment::setFlag(const std::string& name, bool value) {
    flags_[name] = value;
}

int32_t Environment::getCounter(const std::string& name) const {
    auto it = counters_.find(name);
    return it != counters_.end() ? it->second : 0;
}

void Environment::updateCounter(const std::string& name, int32_t delta) {
    // 없는 키는 0에서 시작. int32 범위에서 포화
    int64_t sum = static_cast<int64_t>(counters_[name]) + delta;
    sum = std::min<int64_t>(std::max<int64_t>(sum, INT32_MIN), INT32_MAX);
    counters_[name] = static_cast<int32_t>(sum);
}

void Environment::setPosition(const std::string& document, const std::string& block) {
    position_.document = document;
    position_.block = block;
}

void Environment::clear() {
    position_ = Position();
    flags_.clear();
    counters_.clear();
}

bool Environment::operator==(const Environment& other) const {
    return identity_ == other.identity_
        && position_ == other.position_
        && flags_ == other.flags_
        && counters_ == other.counters_;
}

void Environment::print(std::ostream& out) const {
    out << "  Name: " << identity_ << "\n"
        << "  Progress: [Story: " << position_.document
        << ", Block: " << position_.block << "]\n";

    out << "  Flags: {";
    bool first = true;
    for (const auto& pair : flags_) {
        if (!first) out << ", ";
        out << pair.first << ": " << (pair.second ? "true" : "false");
        first = false;
    }
    out << "}\n";

    out << "  Counters: {";
    first = true;
    for (const auto& pair : counters_) {
        if (!first) out << ", ";
        out << pair.first << ": " << pair.second;
        first = false;
    }
    out << "}\n";
}

std::ostream& operator<<(std::ostream& out, const Environment& env) {
    env.print(out);
    return out;
}

} // namespace Fable
