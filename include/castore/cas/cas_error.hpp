#ifndef CASTORE_CAS_ERROR_HPP
#define CASTORE_CAS_ERROR_HPP

#include <stdexcept>
#include <string>

namespace castore::cas {

class CasError : public std::runtime_error {
public:
    explicit CasError(const std::string& message)
        : std::runtime_error(message) {}
};

// Table root could not be resolved, or the table configuration is invalid
class ConstructionError : public CasError {
public:
    explicit ConstructionError(const std::string& message)
        : CasError("Construction error: " + message) {}
};

class IoError : public CasError {
public:
    explicit IoError(const std::string& message)
        : CasError("IO error: " + message) {}
};

// Stored bytes do not parse into the expected type
class DecodeError : public CasError {
public:
    explicit DecodeError(const std::string& message)
        : CasError("Decode error: " + message) {}
};

// A record cannot be serialized into its canonical content
class EncodeError : public CasError {
public:
    explicit EncodeError(const std::string& message)
        : CasError("Encode error: " + message) {}
};

class DigestError : public CasError {
public:
    explicit DigestError(const std::string& message)
        : CasError("Digest error: " + message) {}
};

} // namespace castore::cas

#endif // CASTORE_CAS_ERROR_HPP
