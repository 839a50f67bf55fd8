#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    CALCGRID_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     CALCGRID_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     CALCGRID_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    CALCGRID_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 公式模块 (formula)
#define FORMULA_DEBUG(...)    CALCGRID_LOG_DEBUG("[DBG][fmla] " __VA_ARGS__)
#define FORMULA_INFO(...)     CALCGRID_LOG_INFO("[INF][fmla] " __VA_ARGS__)
#define FORMULA_WARN(...)     CALCGRID_LOG_WARN("[WRN][fmla] " __VA_ARGS__)
#define FORMULA_ERROR(...)    CALCGRID_LOG_ERROR("[ERR][fmla] " __VA_ARGS__)

// 网格重算模块 (grid)
#define GRID_DEBUG(...)    CALCGRID_LOG_DEBUG("[DBG][grid] " __VA_ARGS__)
#define GRID_INFO(...)     CALCGRID_LOG_INFO("[INF][grid] " __VA_ARGS__)
#define GRID_WARN(...)     CALCGRID_LOG_WARN("[WRN][grid] " __VA_ARGS__)
#define GRID_ERROR(...)    CALCGRID_LOG_ERROR("[ERR][grid] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)    CALCGRID_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)     CALCGRID_LOG_WARN("[WRN][util] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_EVAL_TRACE_LOGS
    #define CALCGRID_LOG_EVAL_TRACE(...) FORMULA_DEBUG(__VA_ARGS__)
#else
    #define CALCGRID_LOG_EVAL_TRACE(...) do {} while(0)
#endif

#if ENABLE_GRAPH_TRACE_LOGS
    #define CALCGRID_LOG_GRAPH_TRACE(...) GRID_DEBUG(__VA_ARGS__)
#else
    #define CALCGRID_LOG_GRAPH_TRACE(...) do {} while(0)
#endif
