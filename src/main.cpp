#include "calcgrid/CalcGrid.hpp"
#include "calcgrid/utils/ModuleLoggers.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <fmt/format.h>

/**
 * 控制台演示程序
 *
 * 从标准输入逐行读取 "地址 文本" 形式的编辑（例如 "A1 10"、"B1 =SUM(A1:A3)"），
 * 输入结束后打印非空区域的显示值。空行与 '#' 开头的行被忽略。
 *
 * 用法: calcgrid_demo [rows cols]
 */
int main(int argc, char** argv)
{
    calcgrid::initialize("", calcgrid::Logger::Level::WARN, true);

    calcgrid::core::GridOptions options;
    if (argc >= 3) {
        try {
            options.rows = std::stoi(argv[1]);
            options.cols = std::stoi(argv[2]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid grid size: " << e.what() << std::endl;
            return 2;
        }
    }

    int exit_code = 0;
    try {
        calcgrid::core::Grid grid(options);

        std::string line;
        int line_number = 0;
        while (std::getline(std::cin, line)) {
            ++line_number;
            if (line.empty() || line.front() == '#') {
                continue;
            }

            std::istringstream iss(line);
            std::string label;
            iss >> label;
            std::string text;
            std::getline(iss >> std::ws, text);

            auto pos = calcgrid::utils::AddressParser::decode(label);
            if (!pos) {
                std::cerr << fmt::format("line {}: {}", line_number, pos.error().fullMessage()) << std::endl;
                exit_code = 1;
                continue;
            }

            auto applied = grid.tryApplyEdit(pos.value().row, pos.value().col, text);
            if (!applied) {
                std::cerr << fmt::format("line {}: {}", line_number, applied.error().message) << std::endl;
                exit_code = 1;
            }
        }

        auto bounds = grid.usedBounds();
        if (bounds) {
            bounds->forEach([&](const calcgrid::core::CellPosition& pos) {
                const auto& value = grid.displayValue(pos.row, pos.col);
                if (!value.empty()) {
                    std::cout << pos.toString() << '\t' << value << '\n';
                }
            });
        }
    } catch (const calcgrid::core::CalcGridException& e) {
        CORE_ERROR("{}", e.getDetailedMessage());
        exit_code = 1;
    }

    calcgrid::cleanup();
    return exit_code;
}
