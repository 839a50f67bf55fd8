#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用

#define ENABLE_EVAL_TRACE_LOGS 0     // 逐单元格求值轨迹（量大，默认关闭）
#define ENABLE_GRAPH_TRACE_LOGS 0    // 依赖图构建细节

// 条件日志宏在 ModuleLoggers.hpp 中使用模块宏来定义：
// CALCGRID_LOG_EVAL_TRACE  -> FORMULA_DEBUG
// CALCGRID_LOG_GRAPH_TRACE -> GRID_DEBUG
