#pragma once

#include <atomic>

namespace relup {

// Set by SIGINT/SIGTERM. Long-running steps poll it between chunks.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested() { return g_cancel.load(std::memory_order_relaxed); }

} // namespace relup
