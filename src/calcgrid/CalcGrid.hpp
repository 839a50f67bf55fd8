#pragma once

// CalcGrid库 - 电子表格公式求值与重算引擎

#include <string>

// 公共类型定义
#include "calcgrid/core/GridTypes.hpp"
#include "calcgrid/core/ErrorCode.hpp"
#include "calcgrid/core/Expected.hpp"
#include "calcgrid/core/Exception.hpp"
#include "calcgrid/core/CellAddress.hpp"

// 网格与公式引擎
#include "calcgrid/core/Grid.hpp"
#include "calcgrid/formula/FormulaEngine.hpp"
#include "calcgrid/formula/DependencyExtractor.hpp"
#include "calcgrid/utils/AddressParser.hpp"
#include "calcgrid/utils/Logger.hpp"

// 版本信息
#define CALCGRID_VERSION_MAJOR 1
#define CALCGRID_VERSION_MINOR 0
#define CALCGRID_VERSION_PATCH 0
#define CALCGRID_VERSION_STRING "1.0.0"

namespace calcgrid {

// 版本信息
inline std::string getVersion() {
    return CALCGRID_VERSION_STRING;
}

/**
 * @brief 初始化CalcGrid库（日志系统）
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param level 日志等级
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "logs/calcgrid.log",
                Logger::Level level = Logger::Level::INFO,
                bool enable_console = true);

/**
 * @brief 清理CalcGrid库资源
 */
void cleanup();

} // namespace calcgrid
