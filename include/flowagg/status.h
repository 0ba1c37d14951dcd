/************************************************************************
Copyright 2024 FlowAgg Contributors

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    https://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
**************************************************************************/

#pragma once

#include <string>

namespace flowagg {

enum class StatusCode {
    kOk = 0,
    kCorruption = 1,
    kIoError = 2,
    kInvalidArgument = 3,
    kInternalError = 4,
};

/**
 * @brief Outcome of a fallible FlowAgg call.
 *
 * Observers surface every storage-facing failure as IOError; Corruption
 * is reserved for unreadable cell contents.
 */
class Status {
public:
    Status() : code_(StatusCode::kOk) {}
    Status(StatusCode code) : code_(code) {}
    Status(StatusCode code, const std::string& message)
        : code_(code), message_(message) {}

    static Status OK() { return Status(); }
    static Status Corruption(const std::string& message = "") {
        return Status(StatusCode::kCorruption, message);
    }
    static Status IOError(const std::string& message = "") {
        return Status(StatusCode::kIoError, message);
    }
    static Status InvalidArgument(const std::string& message = "") {
        return Status(StatusCode::kInvalidArgument, message);
    }
    static Status InternalError(const std::string& message = "") {
        return Status(StatusCode::kInternalError, message);
    }

    bool ok() const { return code_ == StatusCode::kOk; }
    bool IsCorruption() const { return code_ == StatusCode::kCorruption; }
    bool IsIOError() const { return code_ == StatusCode::kIoError; }
    bool IsInvalidArgument() const { return code_ == StatusCode::kInvalidArgument; }
    bool IsInternalError() const { return code_ == StatusCode::kInternalError; }

    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    StatusCode code_;
    std::string message_;
};

inline std::string Status::ToString() const {
    std::string result;
    switch (code_) {
        case StatusCode::kOk:
            result = "OK";
            break;
        case StatusCode::kCorruption:
            result = "Corruption";
            break;
        case StatusCode::kIoError:
            result = "IOError";
            break;
        case StatusCode::kInvalidArgument:
            result = "InvalidArgument";
            break;
        case StatusCode::kInternalError:
            result = "InternalError";
            break;
    }

    if (!message_.empty()) {
        result += ": " + message_;
    }

    return result;
}

} // namespace flowagg
