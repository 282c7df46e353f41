#include <sdrelog/log.hpp>

// 用法：
//   SDRELOG_LEVEL=trace ./hello_logging
//   SDRELOG_LEVEL=warn SDRELOG_TIME=utc ./hello_logging 2>/dev/null
int main() {
    sdrelog::core::enable_logging_from_env(sdrelog::core::Level::info);

    SDRELOG_INFO("This is an info message");
    SDRELOG_DEBUG("This is a debug message");
    SDRELOG_TRACE("This is a trace message");
    SDRELOG_ERROR("This is an error message");
    SDRELOG_WARN("This is a warning message");
    SDRELOG_INFO("Hello {}!", "World");
    return 0;
}
