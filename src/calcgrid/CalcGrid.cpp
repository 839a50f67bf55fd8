#include "calcgrid/CalcGrid.hpp"
#include "calcgrid/utils/ModuleLoggers.hpp"
#include <iostream>

namespace calcgrid {

bool initialize(const std::string& log_file_path, Logger::Level level, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, level, enable_console);
        CORE_INFO("CalcGrid library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统不可用，只能输出到标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize CalcGrid: " << e.what() << std::endl;
        }
        return false;
    }
}

void cleanup() {
    CORE_INFO("CalcGrid library cleanup completed");
    Logger::getInstance().flush();
    Logger::getInstance().shutdown();
}

} // namespace calcgrid
