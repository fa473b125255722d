#ifndef RBT_UTIL_AFFINITY_HPP
#define RBT_UTIL_AFFINITY_HPP

#include <thread>

#ifdef _WIN32
#include <windows.h>
#elif defined(__linux__)
#include <pthread.h>
#include <sched.h>
#elif defined(__APPLE__)
#include <mach/mach.h>
#include <mach/thread_policy.h>
#include <pthread.h>
#endif

namespace util
{

// Pins the calling thread to core `id`, wrapped into the range of cores
// the machine reports.  Returns false when the platform refuses or has no
// affinity API; callers treat that as a hint that was not honoured.
inline bool use_core(int id)
{
    unsigned int cores = std::thread::hardware_concurrency();
    if (id < 0)
        return false;
    if (cores != 0)
        id = static_cast<int>(static_cast<unsigned int>(id) % cores);

#ifdef _WIN32
    HANDLE    thread = GetCurrentThread();
    DWORD_PTR mask   = (static_cast<DWORD_PTR>(1) << id);
    return SetThreadAffinityMask(thread, mask) != 0;
#elif defined(__linux__)
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(id, &cpuset);
    return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
#elif defined(__APPLE__)
    thread_affinity_policy_data_t policy = {id};
    return thread_policy_set(pthread_mach_thread_np(pthread_self()),
                             THREAD_AFFINITY_POLICY, (thread_policy_t)&policy, 1) == KERN_SUCCESS;
#else
    return false;
#endif
}

}  // namespace util

#endif  // RBT_UTIL_AFFINITY_HPP
