// ============================================================================
// fanout/pool/thread_utils.hpp - Worker Thread Configuration
// ============================================================================
//
// Naming, CPU pinning and priority for the pool's worker threads. All of it
// is best-effort: a setting the OS refuses (e.g. a negative nice value
// without CAP_SYS_NICE) is logged and the worker runs anyway.
//
// USAGE:
// ------
//   WorkerThreadConfig config;
//   config.name_prefix = "ingest";
//   config.cpu_affinity = CpuAffinity::Range(0, 3);
//   ApplyWorkerThreadConfig(config, 2);  // "ingest-2" pinned to CPU 2
//
// ============================================================================

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fanout {

// ============================================================================
// CpuAffinity - CPU Core Binding Configuration
// ============================================================================
struct CpuAffinity {
    std::vector<int> cpus;

    // No affinity restriction (thread can run on any core)
    static CpuAffinity None() { return CpuAffinity{}; }

    static CpuAffinity SingleCore(int cpu) { return CpuAffinity{{cpu}}; }

    // Cores [first, last], inclusive
    static CpuAffinity Range(int first, int last) {
        CpuAffinity affinity;
        for (int cpu = first; cpu <= last; ++cpu) {
            affinity.cpus.push_back(cpu);
        }
        return affinity;
    }

    static CpuAffinity Cores(std::vector<int> cores) { return CpuAffinity{std::move(cores)}; }

    bool IsSet() const { return !cpus.empty(); }

    // Worker i is pinned to cpus[i % cpus.size()]
    int CpuForWorker(size_t worker_index) const { return cpus[worker_index % cpus.size()]; }
};

struct WorkerThreadConfig {
    // Workers are named "<prefix>-<index>"; empty leaves the name alone
    std::string name_prefix = "fanout-worker";

    CpuAffinity cpu_affinity;

    // 0 leaves the priority alone; range -20 (highest) to 19 (lowest)
    int nice_value = 0;
};

// Apply `config` to the calling thread as worker `worker_index`.
// Returns false if any setting was refused.
bool ApplyWorkerThreadConfig(const WorkerThreadConfig& config, size_t worker_index);

// Pin the calling thread; true on success or when `affinity` is empty
bool SetThreadAffinity(const CpuAffinity& affinity);

// Linux truncates names to 15 characters
bool SetThreadName(const std::string& name);

bool SetThreadNice(int nice_value);

int GetNumCpus();

}  // namespace fanout
