#include <softpack/error.hpp>

namespace softpack {

const char* SoftpackError::code_name(Code c) {
    switch (c) {
        case IO:                     return "IO";
        case Parse:                  return "Parse";
        case Config:                 return "Config";
        case Manifest:               return "Manifest";
        case Network:                return "Network";
        case Timeout:                return "Timeout";
        case NotFound:               return "NotFound";
        case Duplicate:              return "Duplicate";
        case InvalidArg:             return "InvalidArg";
        case InvalidPath:            return "InvalidPath";
        case FileExists:             return "FileExists";
        case NoChanges:              return "NoChanges";
        case NothingToCommit:        return "NothingToCommit";
        case ConcurrentModification: return "ConcurrentModification";
        case PushRejected:           return "PushRejected";
        case RepositoryUnavailable:  return "RepositoryUnavailable";
        case Builder:                return "Builder";
    }
    return "Unknown";
}

bool SoftpackError::is_retryable() const {
    return code == ConcurrentModification || code == PushRejected ||
           code == Timeout || code == Network;
}

std::string SoftpackError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace softpack
