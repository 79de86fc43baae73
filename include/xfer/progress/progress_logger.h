#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace xfer::progress {

/**
 * One progress session: started() once, any number of progress() updates,
 * completed() once. Calls outside that order are ignored and logged.
 */
class ProgressLogger {
public:
    virtual ~ProgressLogger() = default;

    [[nodiscard]] virtual const std::string& description() const = 0;
    virtual void started() = 0;
    virtual void progress(std::string_view status) = 0;
    virtual void completed() = 0;
};

class ProgressLoggerFactory {
public:
    virtual ~ProgressLoggerFactory() = default;

    virtual std::unique_ptr<ProgressLogger> newOperation(std::string description) = 0;
};

/**
 * Shared lifecycle bookkeeping for the concrete loggers below.
 * Subclasses implement the on*() hooks, which only run for calls in a valid order.
 */
class AbstractProgressLogger : public ProgressLogger {
public:
    explicit AbstractProgressLogger(std::string description);

    [[nodiscard]] const std::string& description() const override { return description_; }
    void started() final;
    void progress(std::string_view status) final;
    void completed() final;

protected:
    virtual void onStarted() = 0;
    virtual void onProgress(std::string_view status) = 0;
    virtual void onCompleted() = 0;

private:
    enum class State { Idle, Running, Completed };

    std::string description_;
    State state_{State::Idle};
};

/**
 * Renders "<description> > <status>" lines to a stream. On a TTY the line is redrawn in
 * place and cleared when the session completes; otherwise every update is a new line.
 */
class ConsoleProgressLoggerFactory final : public ProgressLoggerFactory {
public:
    explicit ConsoleProgressLoggerFactory(std::ostream& out, bool interactive);

    std::unique_ptr<ProgressLogger> newOperation(std::string description) override;

private:
    std::ostream& out_;
    bool interactive_;
};

/**
 * Writes progress as info records on the "progress" spdlog logger.
 */
class LoggingProgressLoggerFactory final : public ProgressLoggerFactory {
public:
    LoggingProgressLoggerFactory();

    std::unique_ptr<ProgressLogger> newOperation(std::string description) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

class NullProgressLoggerFactory final : public ProgressLoggerFactory {
public:
    std::unique_ptr<ProgressLogger> newOperation(std::string description) override;
};

// True when standard error is attached to a terminal.
bool stderrIsTty();

} // namespace xfer::progress
