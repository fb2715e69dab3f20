#pragma once

#include <stdexcept>
#include <string>

namespace vizbin {

enum class FormatErrorKind {
    InvalidMagic,       // not a snapshot file at all
    TruncatedHeader,    // header prefix shorter than its version requires
    TruncatedSection,   // a declared count reads past the supplied buffer
    InvalidConfig,      // embedded config document failed to parse
};

inline const char* to_string(FormatErrorKind kind) {
    switch (kind) {
        case FormatErrorKind::InvalidMagic:     return "invalid magic";
        case FormatErrorKind::TruncatedHeader:  return "truncated header";
        case FormatErrorKind::TruncatedSection: return "truncated section";
        case FormatErrorKind::InvalidConfig:    return "invalid config";
    }
    return "format error";
}

// Thrown by the codecs when bytes do not match the snapshot layout.
class FormatError : public std::runtime_error {
public:
    FormatError(FormatErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    FormatErrorKind kind() const { return kind_; }

private:
    FormatErrorKind kind_;
};

} // namespace vizbin
