#include "status/Sink.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace tc::status;

void Recorder::set(const std::string& message) {
    last_ = message;
    history_.push_back(message);
}

void Recorder::clear() {
    last_.clear();
    history_.clear();
}

Logged::Logged(std::shared_ptr<Sink> next) : next_(std::move(next)) {
    if (!next_) throw std::invalid_argument("status::Logged requires a downstream sink");
}

void Logged::set(const std::string& message) {
    tc::log::Registry::status()->info("{}", message);
    next_->set(message);
}
