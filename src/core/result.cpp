#include "flowfile/core/result.hpp"

namespace flowfile {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::EndOfStream: return "end of stream";
        case ErrorCode::NoHeader: return "no header";
        case ErrorCode::Malformed: return "malformed";
        case ErrorCode::Configuration: return "configuration";
        case ErrorCode::UnknownChecksum: return "unknown checksum";
        case ErrorCode::NotResettable: return "not resettable";
        case ErrorCode::NotSeekable: return "not seekable";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::Transport: return "transport";
        case ErrorCode::HttpStatus: return "http status";
        case ErrorCode::Io: return "io";
        case ErrorCode::ChecksumMismatch: return "checksum mismatch";
        case ErrorCode::ChecksumMissing: return "checksum missing";
        case ErrorCode::ReassemblyTimeout: return "reassembly timeout";
        case ErrorCode::Terminated: return "terminated";
        case ErrorCode::Closed: return "closed";
    }
    return "unknown";
}

} // namespace flowfile
