#include <coderun/errmsg.hh>
#include <coderun/logger.hh>
#include <coderun/macros/throw.hh>
#include <ctime>

namespace {

// Returns local date in format YYYY-MM-DD HH:MM:SS or an empty string on error
std::string local_datetime() {
    time_t now = time(nullptr);
    struct tm tm_buff {};
    if (localtime_r(&now, &tm_buff) == nullptr) {
        return {};
    }
    char buff[32];
    size_t len = strftime(buff, sizeof(buff), "%Y-%m-%d %H:%M:%S", &tm_buff);
    return std::string(buff, len);
}

} // namespace

Logger::Logger(const char* filename)
: f_(fopen(filename, "ae"))
, opened_(true) {
    if (f_ == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
}

void Logger::open(const char* filename) {
    FILE* f = fopen(filename, "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }

    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush() noexcept {
    if (flushed_) {
        return;
    }

    if (logger_.lock()) {
        if (label_) {
            std::string date;
            try {
                date = local_datetime();
            } catch (const std::exception&) {
                // date stays empty
            }
            if (date.empty()) {
                (void)fprintf(
                    logger_.f_,
                    "[ unknown time ] %.*s\n",
                    static_cast<int>(buff_.size()),
                    buff_.data()
                );
            } else {
                (void)fprintf(
                    logger_.f_,
                    "[ %s ] %.*s\n",
                    date.c_str(),
                    static_cast<int>(buff_.size()),
                    buff_.data()
                );
            }
        } else {
            (void)fprintf(logger_.f_, "%.*s\n", static_cast<int>(buff_.size()), buff_.data());
        }

        (void)fflush(logger_.f_);
        logger_.unlock();
    }

    flushed_ = true;
    buff_.clear();
}
