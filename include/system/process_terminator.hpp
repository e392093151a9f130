#pragma once

#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace relup {

class ProcessTerminator {
  public:
    class IProcessTable {
      public:
        virtual ~IProcessTable() = default;
        // Processes whose executable is exe_path, excluding the caller.
        virtual std::vector<pid_t> FindByExecutable(const std::string& exe_path) const = 0;
        virtual bool Signal(pid_t pid, int sig) const = 0;
        virtual bool IsAlive(pid_t pid) const = 0;
    };

    struct Policy {
        // Time between SIGTERM and SIGKILL.
        std::chrono::milliseconds grace{std::chrono::seconds(5)};
        // Time allowed for SIGKILL to take effect.
        std::chrono::milliseconds kill_wait{std::chrono::seconds(2)};
        std::chrono::milliseconds poll_interval{std::chrono::milliseconds(50)};
    };

    ProcessTerminator();
    explicit ProcessTerminator(std::shared_ptr<const IProcessTable> table);

    // SIGTERM every running instance of exe_path, wait up to policy.grace,
    // then SIGKILL the survivors. Fails if any instance is still alive after
    // kill_wait.
    Result TerminateAll(const std::string& exe_path, const Policy& policy) const;

  private:
    static std::shared_ptr<const IProcessTable> DefaultTable();

    std::shared_ptr<const IProcessTable> table_;
};

} // namespace relup
