#pragma once

#include "cli/types.hpp"
#include "config/Config.hpp"

#include <memory>

namespace tc::status {
class Recorder;
class Sink;
}

namespace tc::cli {

// Non-interactive front end: each command opens the sessions it needs, runs one
// operation and reports through the status sink.
class App {
public:
    explicit App(config::Config cfg);

    CommandResult run(const CommandCall& call);

    static std::string usage();

private:
    config::Config cfg_;
    std::shared_ptr<status::Recorder> recorder_;
    std::shared_ptr<status::Sink> status_;

    CommandResult diff(const CommandCall& call);
    CommandResult merge(const CommandCall& call);
    CommandResult compare(const CommandCall& call);
    CommandResult sync(const CommandCall& call);
    CommandResult showConfig() const;
};

}
