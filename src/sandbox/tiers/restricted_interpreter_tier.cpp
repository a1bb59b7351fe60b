/*
 * restricted_interpreter_tier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "restricted_interpreter_tier.hpp"

#include <pybind11/embed.h>

#include <chrono>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace jailchain::sandbox {

namespace {

constexpr const char* kDeadlineCapsule = "jailchain.deadline";
constexpr unsigned kCheckEvery = 64;

struct DeadlineState {
    std::chrono::steady_clock::time_point deadline;
    std::stop_token stopToken;
    std::chrono::seconds timeout{0};
    unsigned events{0};
    bool expired{false};
    bool cancelled{false};
};

int traceDeadline(PyObject* obj, PyFrameObject*, int, PyObject*) {
    auto* state = static_cast<DeadlineState*>(
        PyCapsule_GetPointer(obj, kDeadlineCapsule));
    if (state == nullptr) {
        return -1;
    }
    // Once tripped, keep raising so user code cannot swallow the error
    if (state->expired || state->cancelled) {
        PyErr_SetString(PyExc_TimeoutError, "Execution stopped");
        return -1;
    }
    if (++state->events % kCheckEvery != 0) {
        return 0;
    }
    if (state->stopToken.stop_requested()) {
        state->cancelled = true;
        PyErr_SetString(PyExc_TimeoutError, "Execution cancelled");
        return -1;
    }
    if (std::chrono::steady_clock::now() >= state->deadline) {
        state->expired = true;
        auto message = fmt::format("Execution timed out after {} seconds",
                                   state->timeout.count());
        PyErr_SetString(PyExc_TimeoutError, message.c_str());
        return -1;
    }
    return 0;
}

/**
 * @brief Installs the deadline trace hook for the current thread
 */
class ScopedDeadline {
public:
    explicit ScopedDeadline(DeadlineState& state)
        : capsule_(py::capsule(&state, kDeadlineCapsule)) {
        PyEval_SetTrace(traceDeadline, capsule_.ptr());
    }
    ~ScopedDeadline() { PyEval_SetTrace(nullptr, nullptr); }

    ScopedDeadline(const ScopedDeadline&) = delete;
    ScopedDeadline& operator=(const ScopedDeadline&) = delete;

private:
    py::capsule capsule_;
};

/**
 * @brief Swaps sys.stdout and sys.stderr for StringIO buffers
 */
class StdoutRedirect {
public:
    StdoutRedirect() {
        auto sys = py::module_::import("sys");
        auto io = py::module_::import("io");
        savedStdout_ = sys.attr("stdout");
        savedStderr_ = sys.attr("stderr");
        stdoutBuffer_ = io.attr("StringIO")();
        stderrBuffer_ = io.attr("StringIO")();
        sys.attr("stdout") = stdoutBuffer_;
        sys.attr("stderr") = stderrBuffer_;
    }

    ~StdoutRedirect() {
        // An exception may be pending from the user's code
        py::error_scope pending;
        try {
            auto sys = py::module_::import("sys");
            sys.attr("stdout") = savedStdout_;
            sys.attr("stderr") = savedStderr_;
        } catch (const py::error_already_set& e) {
            spdlog::error("Failed to restore interpreter streams: {}",
                          e.what());
        }
    }

    StdoutRedirect(const StdoutRedirect&) = delete;
    StdoutRedirect& operator=(const StdoutRedirect&) = delete;

    [[nodiscard]] auto stdoutText() const -> std::string {
        return stdoutBuffer_.attr("getvalue")().cast<std::string>();
    }
    [[nodiscard]] auto stderrText() const -> std::string {
        return stderrBuffer_.attr("getvalue")().cast<std::string>();
    }

private:
    py::object savedStdout_;
    py::object savedStderr_;
    py::object stdoutBuffer_;
    py::object stderrBuffer_;
};

auto describeException(py::error_already_set& e) -> std::string {
    std::string type = "Exception";
    if (e.type()) {
        type = py::str(e.type().attr("__name__")).cast<std::string>();
    }
    std::string message = e.value() ? py::str(e.value()).cast<std::string>()
                                    : std::string{};
    return message.empty() ? type : type + ": " + message;
}

}  // namespace

RestrictedInterpreterTier::RestrictedInterpreterTier(
    config::RestrictedTierConfig config)
    : config_(std::move(config)) {}

auto RestrictedInterpreterTier::descriptor() const -> TierDescriptor {
    return describeTier(TierKind::RestrictedInterpreter);
}

auto RestrictedInterpreterTier::supports(Language language) const -> bool {
    return language == Language::Python;
}

auto RestrictedInterpreterTier::probe() noexcept -> bool {
    return Py_IsInitialized() != 0;
}

auto RestrictedInterpreterTier::probeDetail() const -> std::string {
    return Py_IsInitialized() != 0
               ? "in-process interpreter (no memory or CPU isolation; "
                 "deadline cannot interrupt long builtin calls)"
               : "embedded interpreter not initialized";
}

auto RestrictedInterpreterTier::execute(const ExecutionRequest& request,
                                        std::stop_token stopToken)
    -> TierResult {
    if (request.language != Language::Python) {
        return std::unexpected(TierFailure{
            ErrorKind::Unavailable,
            fmt::format("Python sandbox only supports Python code. For {}, "
                        "use local execution.",
                        request.languageName)});
    }
    if (Py_IsInitialized() == 0) {
        spdlog::error("Python interpreter not initialized. "
                      "Please use py::scoped_interpreter in main.");
        return std::unexpected(TierFailure{
            ErrorKind::Unavailable, "Embedded interpreter not initialized"});
    }

    // sys.stdout is process-wide
    std::lock_guard lock(executeMutex_);
    const auto start = std::chrono::steady_clock::now();

    RawExecution raw;
    try {
        py::gil_scoped_acquire gil;

        auto builtins = py::module_::import("builtins");
        py::dict allowed;
        for (const auto& name : config_.builtins) {
            if (py::hasattr(builtins, name.c_str())) {
                allowed[py::str(name)] = builtins.attr(name.c_str());
            }
        }

        py::dict globals;
        globals["__builtins__"] = allowed;
        globals["__name__"] = "__main__";

        DeadlineState deadline;
        deadline.timeout = std::chrono::seconds(config_.timeoutSeconds);
        deadline.deadline = start + deadline.timeout;
        deadline.stopToken = stopToken;

        StdoutRedirect redirect;
        try {
            ScopedDeadline guard(deadline);
            py::exec(request.code, globals);
        } catch (py::error_already_set& e) {
            raw.exitCode = 1;
            raw.stderrText = describeException(e);
            if (deadline.cancelled) {
                raw.kind = ErrorKind::Cancelled;
                raw.detail = "Execution cancelled";
            } else if (deadline.expired) {
                raw.kind = ErrorKind::Timeout;
                raw.detail = fmt::format("Execution timed out after {} seconds",
                                         deadline.timeout.count());
            }
        }

        raw.stdoutText = redirect.stdoutText();
        auto printedErrors = redirect.stderrText();
        if (!printedErrors.empty()) {
            raw.stderrText = printedErrors +
                             (raw.stderrText.empty() ? "" : "\n") +
                             raw.stderrText;
        }
    } catch (const py::error_already_set& e) {
        spdlog::error("Restricted interpreter failed: {}", e.what());
        return std::unexpected(TierFailure{ErrorKind::RuntimeError, e.what()});
    } catch (const std::exception& e) {
        spdlog::error("Restricted interpreter failed: {}", e.what());
        return std::unexpected(TierFailure{ErrorKind::RuntimeError, e.what()});
    }

    raw.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::debug("Restricted interpreter finished in {} ms (exit {})",
                  raw.elapsed.count(), raw.exitCode);
    return raw;
}

}  // namespace jailchain::sandbox
