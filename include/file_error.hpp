#pragma once

#include <string>
#include <string_view>

namespace httpfile {

enum class FileError {
    InvalidConfig,   // bad mode, unbuffered text, bad whence, negative seek target
    Unsupported,     // seek on a non-seekable stream, write/truncate
    Closed,          // operation after close()
    Protocol,        // remote resource changed size between connections
    Transport,       // opener or handle failure, carried unchanged
    Decode           // undecodable bytes in the text layer
};

struct FileErrorInfo {
    FileError error;
    std::string message;
    int status_code = 0;
};

inline std::string_view to_string(FileError error) {
    switch (error) {
        case FileError::InvalidConfig: return "invalid configuration";
        case FileError::Unsupported: return "unsupported operation";
        case FileError::Closed: return "closed stream";
        case FileError::Protocol: return "protocol error";
        case FileError::Transport: return "transport error";
        case FileError::Decode: return "decode error";
    }
    return "unknown error";
}

inline FileErrorInfo closed_error() {
    return FileErrorInfo{FileError::Closed, "I/O operation on closed file"};
}

inline FileErrorInfo unsupported_error(std::string_view what) {
    return FileErrorInfo{FileError::Unsupported, std::string(what) + " is not supported on a read-only stream"};
}

} // namespace httpfile
