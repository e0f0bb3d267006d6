#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

// Host-visible failure: malformed source, unsupported syntax, misuse of the
// driving API, or a guest throw nobody caught.
class SandstepError : public std::runtime_error {
   public:
    SandstepError(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) : std::runtime_error(format_message(type, message, loc)),
                                    type_(type),
                                    detail_(message) {}

    // No source position (driving-API misuse, engine state errors).
    SandstepError(const std::string& type, const std::string& message)
        : std::runtime_error(type + ": " + message), type_(type), detail_(message) {}

    const std::string& type() const { return type_; }
    const std::string& detail() const { return detail_; }

   private:
    std::string type_;
    std::string detail_;

    static std::string format_message(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) {
        return type + " at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }
};

// Raised by step()/run() on the step that moves the engine into Failed.
// The thrown guest value itself stays on the engine (Evaluator::failure()).
class UncaughtGuestError : public SandstepError {
   public:
    UncaughtGuestError(const std::string& rendered, const TokenLocation& loc)
        : SandstepError("UncaughtError", rendered, loc) {}
};
