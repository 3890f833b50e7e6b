#pragma once

#include <string>

namespace sandbox_tail {

// Already-resolved location of a task's sandbox on an agent
struct TaskCoordinates {
    std::string agent_id;
    std::string framework_id;
    std::string executor_id;
    std::string container_id;
    std::string task_path;   // Optional, set for tasks launched inside a pod

    // Throws std::invalid_argument naming the first empty required component
    void validate() const;

    // Absolute sandbox directory on the agent, with a trailing slash
    std::string sandbox_path() const;

    std::string file_path(const std::string& file) const {
        return sandbox_path() + file;
    }
};

} // namespace sandbox_tail
