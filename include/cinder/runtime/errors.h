#pragma once

#include <cinder/runtime/value.h>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file errors.h
 * @brief Script exceptions and the builtin exception hierarchy.
 */

namespace cinder::runtime
{

/** @brief One traceback entry. */
struct TraceFrame
{
    std::string file;
    std::size_t line = 0;
    std::string function;
};

/**
 * @brief A script-level exception propagating through the interpreter.
 *
 * Frames are appended innermost first as the error unwinds through calls.
 */
class ScriptError : public std::exception
{
  public:
    explicit ScriptError(std::shared_ptr<ExceptionObject> exception);

    [[nodiscard]] const std::shared_ptr<ExceptionObject>& exception() const { return exception_; }
    [[nodiscard]] const std::string& type_name() const { return exception_->type->name; }
    /** @brief `str()` of the exception instance. */
    [[nodiscard]] const std::string& message() const { return message_; }
    /** @brief "Type: message", or just "Type" for an empty message. */
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] bool is_a(std::string_view type) const;

    void add_frame(TraceFrame frame) { frames_.push_back(std::move(frame)); }
    [[nodiscard]] const std::vector<TraceFrame>& frames() const { return frames_; }

    /** @brief Render "Traceback (most recent call last):" followed by frames and the error line. */
    [[nodiscard]] std::string format_traceback() const;

  private:
    std::shared_ptr<ExceptionObject> exception_;
    std::vector<TraceFrame> frames_;
    std::string message_;
    std::string what_;
};

/**
 * @brief Raised when the run's CancelToken fires.
 *
 * Not a ScriptError: `except` clauses and `finally` blocks never observe it.
 */
class Interrupted : public std::exception
{
  public:
    [[nodiscard]] const char* what() const noexcept override { return "KeyboardInterrupt"; }
};

/** @brief Builtin exception type by name; throws std::out_of_range for unknown names. */
[[nodiscard]] const std::shared_ptr<ExceptionTypeObject>& exception_type(std::string_view name);

/** @brief Every builtin exception type, bases before subclasses. */
[[nodiscard]] const std::vector<std::shared_ptr<ExceptionTypeObject>>& builtin_exception_types();

/** @brief Register a module-specific exception type (e.g. json.JSONDecodeError). */
[[nodiscard]] std::shared_ptr<ExceptionTypeObject> module_exception_type(std::string_view name,
                                                                         std::string_view base);

/** @brief Instance of `type` with a single message argument (no argument when empty). */
[[nodiscard]] std::shared_ptr<ExceptionObject> make_exception(std::shared_ptr<ExceptionTypeObject> type,
                                                              std::string message);

[[noreturn]] void raise(std::string_view type, std::string message);
[[noreturn]] void raise(std::shared_ptr<ExceptionTypeObject> type, std::string message);

/** @brief Raise with explicit args, e.g. KeyError carrying the missing key itself. */
[[noreturn]] void raise_with_args(std::string_view type, std::vector<Value> args);

/** @brief `str()` of an exception instance. */
[[nodiscard]] std::string exception_message(const ExceptionObject& exception);

} // namespace cinder::runtime
