#include "diff/Editor.hpp"

#include <algorithm>
#include <stdexcept>

using namespace tc::diff;
using namespace tc::diff::model;

void Editor::clampCursor(State& state) {
    auto& lines = state.activeLines();
    if (lines.empty()) lines.emplace_back();

    auto& [row, col] = state.cursor;
    row = std::clamp(row, 0, static_cast<int>(lines.size()) - 1);
    col = std::clamp(col, 0, static_cast<int>(lines[row].size()));
}

void Editor::begin(State& state) {
    state.cursor = {state.scrollLine, 0};
    clampCursor(state);
}

void Editor::insertChar(State& state, const char c) {
    if (c == '\n') {
        splitLine(state);
        return;
    }

    clampCursor(state);
    auto& [row, col] = state.cursor;
    state.activeLines()[row].insert(static_cast<std::size_t>(col), 1, c);
    ++col;
    state.markModified(state.activeSide);
}

void Editor::splitLine(State& state) {
    clampCursor(state);
    auto& lines = state.activeLines();
    auto& [row, col] = state.cursor;

    auto tail = lines[row].substr(static_cast<std::size_t>(col));
    lines[row].erase(static_cast<std::size_t>(col));
    lines.insert(lines.begin() + row + 1, std::move(tail));

    ++row;
    col = 0;
    state.markModified(state.activeSide);
}

bool Editor::deleteBackward(State& state) {
    clampCursor(state);
    auto& lines = state.activeLines();
    auto& [row, col] = state.cursor;

    if (col > 0) {
        lines[row].erase(static_cast<std::size_t>(col - 1), 1);
        --col;
    } else if (row > 0) {
        const auto joinAt = static_cast<int>(lines[row - 1].size());
        lines[row - 1] += lines[row];
        lines.erase(lines.begin() + row);
        --row;
        col = joinAt;
    } else return false;

    state.markModified(state.activeSide);
    return true;
}

bool Editor::deleteForward(State& state) {
    clampCursor(state);
    auto& lines = state.activeLines();
    const auto& [row, col] = state.cursor;

    if (col < static_cast<int>(lines[row].size())) {
        lines[row].erase(static_cast<std::size_t>(col), 1);
    } else if (row < static_cast<int>(lines.size()) - 1) {
        lines[row] += lines[row + 1];
        lines.erase(lines.begin() + row + 1);
    } else return false;

    state.markModified(state.activeSide);
    return true;
}

void Editor::moveUp(State& state) {
    if (state.cursor.row > 0) --state.cursor.row;
    clampCursor(state);
}

void Editor::moveDown(State& state) {
    if (state.cursor.row < static_cast<int>(state.activeLines().size()) - 1) ++state.cursor.row;
    clampCursor(state);
}

void Editor::moveLeft(State& state) {
    if (state.cursor.col > 0) --state.cursor.col;
    clampCursor(state);
}

void Editor::moveRight(State& state) {
    ++state.cursor.col;
    clampCursor(state);
}

void Editor::home(State& state) {
    state.cursor.col = 0;
    clampCursor(state);
}

void Editor::end(State& state) {
    clampCursor(state);
    state.cursor.col = static_cast<int>(state.activeLines()[state.cursor.row].size());
}

bool Editor::apply(State& state, const EditOp& op) {
    switch (op.type) {
        case EditOp::Type::InsertChar: insertChar(state, op.ch); return true;
        case EditOp::Type::SplitLine: splitLine(state); return true;
        case EditOp::Type::DeleteBackward: return deleteBackward(state);
        case EditOp::Type::DeleteForward: return deleteForward(state);
        case EditOp::Type::MoveUp: moveUp(state); return false;
        case EditOp::Type::MoveDown: moveDown(state); return false;
        case EditOp::Type::MoveLeft: moveLeft(state); return false;
        case EditOp::Type::MoveRight: moveRight(state); return false;
        case EditOp::Type::Home: home(state); return false;
        case EditOp::Type::End: end(state); return false;
        default: throw std::invalid_argument("Unknown edit operation");
    }
}

std::string tc::diff::to_string(const EditOp::Type& type) {
    switch (type) {
        case EditOp::Type::InsertChar: return "insert_char";
        case EditOp::Type::SplitLine: return "split_line";
        case EditOp::Type::DeleteBackward: return "delete_backward";
        case EditOp::Type::DeleteForward: return "delete_forward";
        case EditOp::Type::MoveUp: return "move_up";
        case EditOp::Type::MoveDown: return "move_down";
        case EditOp::Type::MoveLeft: return "move_left";
        case EditOp::Type::MoveRight: return "move_right";
        case EditOp::Type::Home: return "home";
        case EditOp::Type::End: return "end";
        default: throw std::invalid_argument("Unknown edit operation");
    }
}
