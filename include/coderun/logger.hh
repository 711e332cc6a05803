#pragma once

#include <atomic>
#include <coderun/concat_tostr.hh>
#include <cstdio>
#include <string>
#include <utility>

class Logger {
private:
    FILE* f_;
    std::atomic<bool> opened_{false}, label_{true};

    void close() noexcept {
        if (opened_.exchange(false)) {
            (void)fclose(f_);
        }
    }

    // Locks the stream, returns false for a dummy logger
    bool lock() noexcept {
        if (f_ == nullptr) {
            return false;
        }

        flockfile(f_);
        return true;
    }

    void unlock() noexcept { funlockfile(f_); }

public:
    // Like open()
    explicit Logger(const char* filename);

    // Like use(), it accepts nullptr for which a dummy logger is created
    explicit Logger(FILE* stream) noexcept : f_(stream) {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Opens file @p filename in append mode as log file, if fopen()
     *   fails an exception is thrown and the current stream is unchanged
     *
     * @param filename file to open
     *
     * @errors Throws std::runtime_error if fopen() fails
     */
    void open(const char* filename);

    /// Sets @p stream as log stream, nullptr makes the logger a dummy
    void use(FILE* stream) noexcept {
        close();
        f_ = stream;
    }

    /// Sets @p stream as log stream and returns the current one. The logger
    /// does not take ownership of @p stream
    FILE* exchange_log_stream(FILE* stream) noexcept {
        close();
        return std::exchange(f_, stream);
    }

    [[nodiscard]] bool label() const noexcept { return label_.load(std::memory_order_relaxed); }

    bool label(bool add_label) noexcept { return label_.exchange(add_label); }

    class Appender {
    private:
        friend class Logger;

        Logger& logger_;
        bool flushed_ = true;
        bool label_;
        std::string buff_;

        template <class... Args>
        explicit Appender(Logger& logger, Args&&... args)
        : logger_(logger)
        , label_(logger.label()) {
            operator()(std::forward<Args>(args)...);
        }

    public:
        Appender(const Appender&) = delete;

        Appender(Appender&& app) noexcept
        : logger_(app.logger_)
        , flushed_(app.flushed_)
        , label_(app.label_)
        , buff_(std::move(app.buff_)) {
            app.flushed_ = true;
        }

        Appender& operator=(const Appender&) = delete;
        Appender& operator=(Appender&&) = delete;

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        Appender& operator()(Args&&... args) {
            back_insert(buff_, std::forward<Args>(args)...);
            flushed_ = false;
            return *this;
        }

        void flush() noexcept;

        ~Appender() { flush(); }
    };

    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    Appender operator()(Args&&... args) {
        return Appender(*this, std::forward<Args>(args)...);
    }

    ~Logger() { close(); }
};

// By default both write to stderr
inline Logger stdlog(stderr); // Standard (default) log
inline Logger errlog(stderr); // Error log
