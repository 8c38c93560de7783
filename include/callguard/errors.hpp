#pragma once

#include <stdexcept>
#include <string>

namespace callguard {

class InvalidParticipants : public std::runtime_error {
public:
    explicit InvalidParticipants(const std::string& message) : std::runtime_error(message) {}
};

// Operation attempted on a session that already reached a terminal state.
class SessionClosed : public std::runtime_error {
public:
    explicit SessionClosed(const std::string& message) : std::runtime_error(message) {}
};

class InvalidStateTransition : public std::runtime_error {
public:
    explicit InvalidStateTransition(const std::string& message) : std::runtime_error(message) {}
};

// Recording refused until every participant has given recording consent.
class ConsentRequired : public std::runtime_error {
public:
    explicit ConsentRequired(const std::string& message) : std::runtime_error(message) {}
};

class UploadExhausted : public std::runtime_error {
public:
    explicit UploadExhausted(const std::string& message) : std::runtime_error(message) {}
};

class Unauthorized : public std::runtime_error {
public:
    explicit Unauthorized(const std::string& message) : std::runtime_error(message) {}
};

// Transient infrastructure failure; callers may retry.
class StorageUnavailable : public std::runtime_error {
public:
    explicit StorageUnavailable(const std::string& message) : std::runtime_error(message) {}
};

class NotFound : public std::runtime_error {
public:
    explicit NotFound(const std::string& message) : std::runtime_error(message) {}
};

}
