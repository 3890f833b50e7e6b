#include "sandbox_path.hpp"
#include <stdexcept>

namespace sandbox_tail {

namespace {
const char* kSlavesRoot = "/var/lib/mesos/slave/slaves/";
}

void TaskCoordinates::validate() const {
    if (agent_id.empty()) throw std::invalid_argument("agent_id cannot be empty");
    if (framework_id.empty()) throw std::invalid_argument("framework_id cannot be empty");
    if (executor_id.empty()) throw std::invalid_argument("executor_id cannot be empty");
    if (container_id.empty()) throw std::invalid_argument("container_id cannot be empty");
}

std::string TaskCoordinates::sandbox_path() const {
    std::string path = kSlavesRoot + agent_id +
                       "/frameworks/" + framework_id +
                       "/executors/" + executor_id +
                       "/runs/" + container_id + "/";
    if (!task_path.empty()) {
        path += "tasks/" + task_path + "/";
    }
    return path;
}

} // namespace sandbox_tail
