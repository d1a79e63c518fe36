#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace cargo3ds::diag {

enum class Code : uint16_t {
    A_ARGUMENT_AMBIGUITY = 1,

    T_TOOLCHAIN_NOT_FOUND = 100,
    T_COMPILER_UNSUPPORTED,

    B_BUILD_FAILED = 200,
    B_NO_ARTIFACT_PRODUCED,
    B_PACKAGE_FAILED,

    D_DEVICE_NOT_FOUND = 300,
    D_CONNECTION_EXHAUSTED,
    D_TRANSFER_ABORTED,
    D_SERVER_FAILED,
    D_CANCELLED,
};

inline const char* code_name(Code c) {
    switch (c) {
        case Code::A_ARGUMENT_AMBIGUITY: return "A_ARGUMENT_AMBIGUITY";
        case Code::T_TOOLCHAIN_NOT_FOUND: return "T_TOOLCHAIN_NOT_FOUND";
        case Code::T_COMPILER_UNSUPPORTED: return "T_COMPILER_UNSUPPORTED";
        case Code::B_BUILD_FAILED: return "B_BUILD_FAILED";
        case Code::B_NO_ARTIFACT_PRODUCED: return "B_NO_ARTIFACT_PRODUCED";
        case Code::B_PACKAGE_FAILED: return "B_PACKAGE_FAILED";
        case Code::D_DEVICE_NOT_FOUND: return "D_DEVICE_NOT_FOUND";
        case Code::D_CONNECTION_EXHAUSTED: return "D_CONNECTION_EXHAUSTED";
        case Code::D_TRANSFER_ABORTED: return "D_TRANSFER_ABORTED";
        case Code::D_SERVER_FAILED: return "D_SERVER_FAILED";
        case Code::D_CANCELLED: return "D_CANCELLED";
    }
    return "UNKNOWN";
}

/// Process exit status used when no child process supplied one.
inline int default_exit_code(Code c) {
    switch (c) {
        case Code::A_ARGUMENT_AMBIGUITY: return 2;
        case Code::T_TOOLCHAIN_NOT_FOUND: return 3;
        case Code::T_COMPILER_UNSUPPORTED: return 1;
        case Code::B_BUILD_FAILED: return 1;
        case Code::B_NO_ARTIFACT_PRODUCED: return 4;
        case Code::B_PACKAGE_FAILED: return 5;
        case Code::D_DEVICE_NOT_FOUND: return 6;
        case Code::D_CONNECTION_EXHAUSTED: return 7;
        case Code::D_TRANSFER_ABORTED: return 8;
        case Code::D_SERVER_FAILED: return 9;
        case Code::D_CANCELLED: return 130;
    }
    return 1;
}

struct Error {
    Code code{};
    int exit_code = 1;
    std::string message;
    std::string detail;
};

inline Error make_error(Code code, std::string message, std::string detail = {}) {
    return Error{code, default_exit_code(code), std::move(message), std::move(detail)};
}

/// Failure of a child process: keep its exit status, fall back to the code default on 0.
inline Error make_child_error(Code code, int child_exit, std::string message, std::string detail = {}) {
    Error e = make_error(code, std::move(message), std::move(detail));
    if (child_exit != 0) e.exit_code = child_exit;
    return e;
}

} // namespace cargo3ds::diag
