#include "ilibrary_errors.hpp"

std::string CommandError::describe() const {
    std::string text;
    if (!sqlState.empty()) {
        text += "[" + sqlState + "] ";
    }
    text += message.empty() ? std::string("unknown command failure") : message;
    if (nativeCode != 0) {
        text += " (native " + std::to_string(nativeCode) + ")";
    }
    return text;
}

const char* toString(TransferError::Kind kind) {
    switch (kind) {
    case TransferError::Kind::AuthenticationFailed:
        return "AuthenticationFailed";
    case TransferError::Kind::ProtocolError:
        return "ProtocolError";
    case TransferError::Kind::RemoteFileNotFound:
        return "RemoteFileNotFound";
    }
    return "Unknown";
}

std::string TransferError::describe() const {
    return std::string(toString(kind)) + ": " + message;
}
