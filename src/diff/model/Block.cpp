#include "diff/model/Block.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace tc::diff::model;

std::string tc::diff::model::to_string(const Block::Kind& kind) {
    switch (kind) {
        case Block::Kind::Equal: return "equal";
        case Block::Kind::Add: return "add";
        case Block::Kind::Delete: return "delete";
        case Block::Kind::Modify: return "modify";
        default: throw std::invalid_argument("Unknown diff block kind");
    }
}

Block::Kind tc::diff::model::blockKindFromString(const std::string& str) {
    if (str == "equal") return Block::Kind::Equal;
    if (str == "add") return Block::Kind::Add;
    if (str == "delete") return Block::Kind::Delete;
    if (str == "modify") return Block::Kind::Modify;
    throw std::invalid_argument("Unknown diff block kind: " + str);
}

static std::string rangeToString(const LineRange& r) {
    if (r.empty()) return fmt::format("[{}..)", r.start);
    return fmt::format("[{}..{}]", r.start, r.end);
}

std::string tc::diff::model::to_string(const Block& block) {
    return fmt::format("{:<6} left{} right{}", to_string(block.kind), rangeToString(block.left), rangeToString(block.right));
}
