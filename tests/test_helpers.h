#pragma once

#include "massing/lot/LotGeometry.h"
#include "massing/params/ParameterSet.h"
#include <SDL3/SDL_log.h>
#include <string>
#include <vector>

namespace massing {
namespace testing {

// Rectangular-lot parameters used throughout the tests: 45 m cap,
// 4 m ground floor, 3 m upper floors, setbacks 5 / 3 / 1.5, escalation from floor 4
inline params::ParameterSet exampleParameters() {
    params::ParameterSet p;
    p.normative.maxHeight = 45.0;
    p.normative.maxFar = 20.0;
    p.normative.gfFloorHeight = 4.0;
    p.normative.ufFloorHeight = 3.0;
    p.normative.minFrontSetback = 5.0;
    p.normative.minBackSetback = 3.0;
    p.normative.minSideSetback = 1.5;
    p.normative.minSetbackStartFloor = 4;
    p.normative.backSetbackPercent = 0.20;
    return p;
}

// 25 x 50 m lot, front on y = 0
inline lot::LotGeometry exampleLot() {
    return lot::LotGeometry::rectangle(25.0, 50.0);
}

// Collects application log messages, debug included, while in scope
class LogCapture {
public:
    LogCapture() {
        SDL_GetLogOutputFunction(&previous_, &previousData_);
        previousPriority_ = SDL_GetLogPriority(SDL_LOG_CATEGORY_APPLICATION);
        SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_DEBUG);
        SDL_SetLogOutputFunction(&LogCapture::collect, this);
    }

    ~LogCapture() {
        SDL_SetLogOutputFunction(previous_, previousData_);
        SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, previousPriority_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool contains(const std::string& text) const {
        for (const auto& m : messages_) {
            if (m.find(text) != std::string::npos) return true;
        }
        return false;
    }

private:
    static void SDLCALL collect(void* userdata, int category, SDL_LogPriority, const char* message) {
        if (category == SDL_LOG_CATEGORY_APPLICATION) {
            static_cast<LogCapture*>(userdata)->messages_.emplace_back(message);
        }
    }

    SDL_LogOutputFunction previous_ = nullptr;
    void* previousData_ = nullptr;
    SDL_LogPriority previousPriority_ = SDL_LOG_PRIORITY_INFO;
    std::vector<std::string> messages_;
};

} // namespace testing
} // namespace massing
