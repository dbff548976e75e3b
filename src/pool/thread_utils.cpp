// ============================================================================
// fanout/pool/thread_utils.cpp - Worker Thread Configuration
// ============================================================================

#include "fanout/pool/thread_utils.hpp"

#include <pthread.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>

#include "fanout/core/log.hpp"

namespace fanout {

bool ApplyWorkerThreadConfig(const WorkerThreadConfig& config, size_t worker_index) {
    bool ok = true;

    if (!config.name_prefix.empty()) {
        std::string name = config.name_prefix + "-" + std::to_string(worker_index);
        if (!SetThreadName(name)) {
            GetLogger()->debug("worker {}: could not set thread name '{}'", worker_index, name);
            ok = false;
        }
    }

    if (config.cpu_affinity.IsSet()) {
        int cpu = config.cpu_affinity.CpuForWorker(worker_index);
        if (!SetThreadAffinity(CpuAffinity::SingleCore(cpu))) {
            GetLogger()->warn("worker {}: could not pin to cpu {}", worker_index, cpu);
            ok = false;
        }
    }

    if (config.nice_value != 0 && !SetThreadNice(config.nice_value)) {
        GetLogger()->warn("worker {}: could not set nice value {}", worker_index, config.nice_value);
        ok = false;
    }

    return ok;
}

bool SetThreadAffinity(const CpuAffinity& affinity) {
    if (!affinity.IsSet()) {
        return true;
    }

    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    for (int cpu : affinity.cpus) {
        if (cpu >= 0 && cpu < CPU_SETSIZE) {
            CPU_SET(cpu, &cpuset);
        }
    }
    return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
}

bool SetThreadName(const std::string& name) {
    std::string truncated = name.substr(0, 15);
    return pthread_setname_np(pthread_self(), truncated.c_str()) == 0;
}

bool SetThreadNice(int nice_value) {
    nice_value = std::clamp(nice_value, -20, 19);
    // setpriority on a TID affects only this thread on Linux
    auto tid = static_cast<id_t>(syscall(SYS_gettid));
    return setpriority(PRIO_PROCESS, tid, nice_value) == 0;
}

int GetNumCpus() {
    return static_cast<int>(sysconf(_SC_NPROCESSORS_ONLN));
}

}  // namespace fanout
