#pragma once

#include <string>

namespace core::types {

    enum class ResultCode {
        Success,
        RenderError,
        DeviceNotFound,
        UnknownModel,
        ModelRequired,
        TransportError,
        Timeout,
        Error
    };

    inline std::string resultCodeToString(ResultCode code) {
        switch (code) {
            case ResultCode::Success: return "SUCCESS";
            case ResultCode::RenderError: return "RENDER_ERROR";
            case ResultCode::DeviceNotFound: return "DEVICE_NOT_FOUND";
            case ResultCode::UnknownModel: return "UNKNOWN_MODEL";
            case ResultCode::ModelRequired: return "MODEL_REQUIRED";
            case ResultCode::TransportError: return "TRANSPORT_ERROR";
            case ResultCode::Timeout: return "TIMEOUT";
            case ResultCode::Error: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    struct Result {
        ResultCode code;
        std::string message;

        inline bool isSuccess() const {
            return code == ResultCode::Success;
        }

        inline bool isTimeout() const {
            return code == ResultCode::Timeout;
        }

        inline bool isResolutionFailure() const {
            return code == ResultCode::DeviceNotFound ||
                   code == ResultCode::UnknownModel ||
                   code == ResultCode::ModelRequired;
        }

        static inline Result success(const std::string &msg = "Success") {
            return {ResultCode::Success, msg};
        }

        static inline Result failure(ResultCode code, const std::string &msg) {
            return {code, msg};
        }

        static inline Result error(const std::string &msg = "Error") {
            return {ResultCode::Error, msg};
        }
    };

}
