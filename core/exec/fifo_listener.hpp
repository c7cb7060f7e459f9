#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/unique_fd.hpp"
#include "exec/i_listener.hpp"

namespace envkeeper {
namespace exec {

/**
 * @brief Collects lines the child writes to a named pipe
 *
 * The FIFO path is exported through env_var. The listener keeps its own write
 * end open so the read end never reports end-of-file between writers.
 */
class FifoListener : public IListener {
public:
    static std::unique_ptr<FifoListener> create(const std::string &env_var, std::string &error);

    ~FifoListener() override;

    std::string name() const override { return "fifo"; }
    bool set_process_env(Command &command, std::string &error) override;
    int wait_fd() const override { return read_end_.get(); }
    std::optional<ListenerEvent> next() override;
    bool stop(std::string &error) override;

    const std::string &path() const { return path_; }

    // Complete lines received so far
    const std::vector<std::string> &lines() const { return lines_; }

private:
    FifoListener(const std::string &dir, const std::string &env_var);

    bool drain(std::string &error);

    std::string dir_;
    std::string path_;
    std::string env_var_;
    common::UniqueFd read_end_;
    common::UniqueFd write_end_;
    std::string partial_;
    std::vector<std::string> lines_;
};

}  // namespace exec
}  // namespace envkeeper
