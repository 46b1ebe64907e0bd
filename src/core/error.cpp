// ============================================================================
// cotask/core/error.cpp - Error Category and TaskError
// ============================================================================

#include "cotask/core/error.hpp"

#include <fmt/format.h>

namespace cotask {

namespace {

class CotaskCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "cotask"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::Aborted:
                return "Task aborted";
            case Errc::Failed:
                return "Task failed";
            case Errc::InvalidArgument:
                return "Invalid argument";
            case Errc::IoError:
                return "I/O error";
            default:
                return "Unknown cotask error";
        }
    }
};

}  // namespace

const std::error_category& CotaskCategory() noexcept {
    static const CotaskCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), CotaskCategory()};
}

TaskError TaskError::Abort(std::string reason) {
    return TaskError{Kind::Aborted, std::move(reason), make_error_code(Errc::Aborted)};
}

TaskError TaskError::Failure(std::error_code code, std::string message) {
    if (!code) {
        code = make_error_code(Errc::Failed);
    }
    if (message.empty()) {
        message = code.message();
    }
    return TaskError{Kind::Failed, std::move(message), code};
}

std::string TaskError::Message() const {
    if (IsAborted()) {
        return fmt::format("aborted: {}", reason);
    }
    return fmt::format("failed: {} ({}:{})", reason, code.category().name(), code.value());
}

}  // namespace cotask
