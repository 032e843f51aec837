#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace logging
{
    namespace
    {
        std::atomic<Level> g_level{Level::Info};
        std::mutex         g_write_mutex;

        const char* prefix(Level level)
        {
            switch (level) {
                case Level::Debug:   return "DEBUG: ";
                case Level::Info:    return "INFO: ";
                case Level::Warning: return "WARNING: ";
                case Level::Error:   return "ERROR: ";
            }
            return "";
        }
    }

    void  setLevel(Level level) { g_level.store(level); }
    Level level()               { return g_level.load(); }

    Level parseLevel(const std::string& name)
    {
        if (name == "debug")   return Level::Debug;
        if (name == "info")    return Level::Info;
        if (name == "warning") return Level::Warning;
        if (name == "error")   return Level::Error;
        throw std::invalid_argument("unknown log level: " + name);
    }

    Line::Line(Level level, const char* tag) : level_(level), tag_(tag) {}

    Line::~Line()
    {
        std::ostream& os = (level_ >= Level::Warning) ? std::cerr : std::cout;
        std::lock_guard<std::mutex> lock(g_write_mutex);
        os << prefix(level_) << '[' << tag_ << "] " << oss_.str() << '\n';
        os.flush();
    }
}
