#pragma once

#include <string>

namespace core::print {
    enum class JobState {
        IDLE,
        COMPOSING, // device resolution + layout
        ENCODING,
        DELIVERING,
        DONE,
        FAILED,
    };

    /**
     * @brief Convert JobState enum to string code
     */
    inline std::string jobStateToCode(JobState state) {
        switch (state) {
            case JobState::IDLE: return "IDL";
            case JobState::COMPOSING: return "CMP";
            case JobState::ENCODING: return "ENC";
            case JobState::DELIVERING: return "DLV";
            case JobState::DONE: return "DON";
            case JobState::FAILED: return "FAI";
            default: return "UNK";
        }
    }

    inline bool isTerminal(JobState state) {
        return state == JobState::DONE || state == JobState::FAILED;
    }
}
