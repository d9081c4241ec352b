#pragma once

#include <memory>
#include <string>
#include <vector>

namespace tc::status {

// Receives the human-readable outcome of every core operation.
class Sink {
public:
    virtual ~Sink() = default;
    virtual void set(const std::string& message) = 0;
};

class Recorder : public Sink {
public:
    void set(const std::string& message) override;

    [[nodiscard]] const std::string& last() const { return last_; }
    [[nodiscard]] const std::vector<std::string>& history() const { return history_; }
    void clear();

private:
    std::string last_;
    std::vector<std::string> history_;
};

// Mirrors each message onto the "status" logger before handing it on.
class Logged : public Sink {
public:
    explicit Logged(std::shared_ptr<Sink> next);

    void set(const std::string& message) override;

private:
    std::shared_ptr<Sink> next_;
};

}
