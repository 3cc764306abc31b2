#pragma once
#include <stdexcept>
#include <string>

/**
* @file
* @brief Exception types for the failures that are allowed to leave a component.
*
* Decode failures are plain values (see @ref speedtest::DecodeError) and per-session
* I/O failures are recorded in @ref speedtest::SessionResult; only the classes below
* are thrown.
*/

namespace speedtest {

/**
* @brief Socket creation/bind/listen failed at startup.
*
* The only error class that terminates the process: mains catch it, print a
* diagnostic and exit non-zero.
*/
class BindError : public std::runtime_error {
public:
    explicit BindError(const std::string& what) : std::runtime_error(what) {}
};

/// @brief Discovery was stopped before any valid Offer arrived.
class NoOfferReceived : public std::runtime_error {
public:
    NoOfferReceived() : std::runtime_error("no offer received before stop") {}
};

/// @brief Connection or I/O failure inside one transfer session.
class SessionIOError : public std::runtime_error {
public:
    explicit SessionIOError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace speedtest
