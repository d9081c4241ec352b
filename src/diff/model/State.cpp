#include "diff/model/State.hpp"
#include "diff/Calculator.hpp"

#include <algorithm>

using namespace tc::diff::model;

void State::recompute(const unsigned int lookahead) {
    blocks = Calculator::calculate(leftLines, rightLines, lookahead);
    currentBlock = std::clamp(currentBlock, 0, static_cast<int>(blocks.size()) - 1);
}

std::string tc::diff::model::to_string(const Side& side) {
    return side == Side::Left ? "left" : "right";
}
