#include "eccrypt/error.hpp"

namespace eccrypt {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kInvalidKey:
            return "InvalidKey";
        case ErrorKind::kEncoding:
            return "Encoding";
        case ErrorKind::kMacMismatch:
            return "MacMismatch";
        case ErrorKind::kCipherFailure:
            return "CipherFailure";
        case ErrorKind::kInvalidInput:
            return "InvalidInput";
        case ErrorKind::kInternal:
            return "Internal";
    }
    return "Unknown";
}

void Throw(ErrorKind kind, const std::string& message) {
    throw Error(kind, message);
}

}  // namespace eccrypt
