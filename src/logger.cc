#include <ctime>
#include <execbox/errmsg.hh>
#include <execbox/logger.hh>
#include <execbox/macros/throw.hh>

Logger::Logger(const std::string& filename)
: f_(fopen(filename.c_str(), "abe"))
, opened_(true) {
    if (f_ == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
}

void Logger::open(const std::string& filename) {
    FILE* f = fopen(filename.c_str(), "abe");
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
        if (logger_.label()) {
            struct timespec ts;
            struct tm tm;
            char date[32];
            if (clock_gettime(CLOCK_REALTIME, &ts) == 0 && localtime_r(&ts.tv_sec, &tm) &&
                strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm) > 0)
            {
                (void)fprintf(
                    logger_.f_,
                    "[ %s.%03ld ] %.*s\n",
                    date,
                    ts.tv_nsec / 1'000'000,
                    static_cast<int>(buff_.size()),
                    buff_.data()
                );
            } else {
                (void)fprintf(
                    logger_.f_,
                    "[ unknown time ] %.*s\n",
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
