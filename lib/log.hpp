#pragma once
#include <sstream>
#include <string>

namespace logging
{
    enum class Level { Debug = 0, Info, Warning, Error };

    void  setLevel(Level level);
    Level level();

    // Parses "debug", "info", "warning" or "error".
    // Throws std::invalid_argument on anything else.
    Level parseLevel(const std::string& name);

    // Collects one log line and writes it, prefixed, when destroyed.
    class Line {
    public:
        Line(Level level, const char* tag);
        ~Line();

        std::ostringstream& stream() { return oss_; }

    private:
        Level              level_;
        const char*        tag_;
        std::ostringstream oss_;
    };
}

#define PATCHSEG_LOG(LEVEL, TAG)                                              \
    if (::logging::level() > (LEVEL)) {}                                      \
    else ::logging::Line((LEVEL), (TAG)).stream()

#define PATCHSEG_LOG_DEBUG(TAG) PATCHSEG_LOG(::logging::Level::Debug,   TAG)
#define PATCHSEG_LOG_INFO(TAG)  PATCHSEG_LOG(::logging::Level::Info,    TAG)
#define PATCHSEG_LOG_WARN(TAG)  PATCHSEG_LOG(::logging::Level::Warning, TAG)
#define PATCHSEG_LOG_ERROR(TAG) PATCHSEG_LOG(::logging::Level::Error,   TAG)
