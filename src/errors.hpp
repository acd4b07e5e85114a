#pragma once
#include <stdexcept>
#include <string>

struct SecmanError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Bad or missing configuration, unreadable secrets file.
struct ConfigError : SecmanError {
    using SecmanError::SecmanError;
};

// Key environment variable unset or empty.
struct KeyResolutionError : SecmanError {
    using SecmanError::SecmanError;
};

// Malformed key, wrong key or corrupted token.
struct CryptoError : SecmanError {
    using SecmanError::SecmanError;
};

struct FormatError : SecmanError {
    using SecmanError::SecmanError;
};

struct SignatureMismatchError : SecmanError {
    using SecmanError::SecmanError;
};
