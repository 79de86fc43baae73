/*
 * xfer/src/progress/progress_loggers.cpp
 *
 * Progress session implementations:
 * - ConsoleProgressLogger: single status line (TTY redraw) or plain lines
 * - LoggingProgressLogger: spdlog "progress" logger
 * - NullProgressLogger: no output, lifecycle checks only
 */

#include <xfer/progress/progress_logger.h>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <ostream>
#include <utility>

#if defined(_WIN32)
#include <io.h>
#define XFER_ISATTY _isatty
#define XFER_FILENO _fileno
#else
#include <unistd.h>
#define XFER_ISATTY isatty
#define XFER_FILENO fileno
#endif

namespace xfer::progress {

AbstractProgressLogger::AbstractProgressLogger(std::string description)
    : description_(std::move(description)) {}

void AbstractProgressLogger::started() {
    if (state_ != State::Idle) {
        spdlog::warn("Progress '{}' already started", description_);
        return;
    }
    state_ = State::Running;
    onStarted();
}

void AbstractProgressLogger::progress(std::string_view status) {
    if (state_ != State::Running) {
        spdlog::warn("Progress '{}' is not running; dropping status '{}'", description_, status);
        return;
    }
    onProgress(status);
}

void AbstractProgressLogger::completed() {
    if (state_ != State::Running) {
        spdlog::warn("Progress '{}' completed while not running", description_);
        return;
    }
    state_ = State::Completed;
    onCompleted();
}

namespace {

class ConsoleProgressLogger final : public AbstractProgressLogger {
public:
    ConsoleProgressLogger(std::string description, std::ostream& out, bool interactive)
        : AbstractProgressLogger(std::move(description)), out_(out), interactive_(interactive) {}

protected:
    void onStarted() override {
        if (interactive_) {
            out_ << "\r\033[K" << description() << std::flush;
        } else {
            out_ << description() << '\n';
        }
    }

    void onProgress(std::string_view status) override {
        if (interactive_) {
            out_ << "\r\033[K" << description() << " > " << status << std::flush;
        } else {
            out_ << description() << " > " << status << '\n';
        }
    }

    void onCompleted() override {
        if (interactive_) {
            // Clear the line
            out_ << "\r\033[K" << std::flush;
        } else {
            out_.flush();
        }
    }

private:
    std::ostream& out_;
    bool interactive_;
};

class LoggingProgressLogger final : public AbstractProgressLogger {
public:
    LoggingProgressLogger(std::string description, std::shared_ptr<spdlog::logger> logger)
        : AbstractProgressLogger(std::move(description)), logger_(std::move(logger)) {}

protected:
    void onStarted() override { logger_->debug("{} started", description()); }
    void onProgress(std::string_view status) override {
        logger_->info("{} > {}", description(), status);
    }
    void onCompleted() override { logger_->debug("{} completed", description()); }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

class NullProgressLogger final : public AbstractProgressLogger {
public:
    using AbstractProgressLogger::AbstractProgressLogger;

protected:
    void onStarted() override {}
    void onProgress(std::string_view) override {}
    void onCompleted() override {}
};

} // namespace

ConsoleProgressLoggerFactory::ConsoleProgressLoggerFactory(std::ostream& out, bool interactive)
    : out_(out), interactive_(interactive) {}

std::unique_ptr<ProgressLogger> ConsoleProgressLoggerFactory::newOperation(std::string description) {
    return std::make_unique<ConsoleProgressLogger>(std::move(description), out_, interactive_);
}

LoggingProgressLoggerFactory::LoggingProgressLoggerFactory() {
    // Share the default logger's sinks so progress lands wherever logging was configured.
    auto base = spdlog::default_logger();
    logger_ = std::make_shared<spdlog::logger>("progress", base->sinks().begin(),
                                               base->sinks().end());
    logger_->set_level(base->level());
}

std::unique_ptr<ProgressLogger> LoggingProgressLoggerFactory::newOperation(std::string description) {
    return std::make_unique<LoggingProgressLogger>(std::move(description), logger_);
}

std::unique_ptr<ProgressLogger> NullProgressLoggerFactory::newOperation(std::string description) {
    return std::make_unique<NullProgressLogger>(std::move(description));
}

bool stderrIsTty() {
    return XFER_ISATTY(XFER_FILENO(stderr)) != 0;
}

} // namespace xfer::progress
