#pragma once

#include <stdexcept>
#include <string>

// Transient failure talking to the inventory API. The cycle is skipped.
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& what) : std::runtime_error(what) {}
};

// Unreadable or schema-mismatched cache file. Never escapes CacheStore::load().
class CacheCorruptionError : public std::runtime_error {
public:
    explicit CacheCorruptionError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid configuration or credentials at startup. Fatal.
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& what) : std::runtime_error(what) {}
};
