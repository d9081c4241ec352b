#pragma once

#include "diff/model/State.hpp"

namespace tc::diff {

struct EditOp {
    enum class Type {
        InsertChar,
        SplitLine,
        DeleteBackward,
        DeleteForward,
        MoveUp,
        MoveDown,
        MoveLeft,
        MoveRight,
        Home,
        End
    };

    Type type{Type::MoveRight};
    char ch{'\0'};

    static EditOp insert(const char c) { return {Type::InsertChar, c}; }
    static EditOp of(const Type t) { return {t, '\0'}; }
};

// In-place editing of the active side's buffer at state.cursor. Columns are byte offsets.
struct Editor {
    // Cursor to (scrollLine clamped into the active buffer, 0).
    static void begin(model::State& state);

    // Returns true when the buffer changed; the side's modified flag is set in that case.
    static bool apply(model::State& state, const EditOp& op);

    // '\n' splits the line instead of landing inside it.
    static void insertChar(model::State& state, char c);
    static void splitLine(model::State& state);
    static bool deleteBackward(model::State& state);
    static bool deleteForward(model::State& state);

    static void moveUp(model::State& state);
    static void moveDown(model::State& state);
    static void moveLeft(model::State& state);
    static void moveRight(model::State& state);
    static void home(model::State& state);
    static void end(model::State& state);

private:
    static void clampCursor(model::State& state);
};

std::string to_string(const EditOp::Type& type);

}
