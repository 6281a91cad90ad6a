
#pragma once

#include <functional>
#include <vector>

namespace spindle
{
unsigned hardware_concurrency();

// Jobs are queued with 'schedule', and run by 'execute'. The first exception
// thrown by any job is rethrown from 'execute' after every job has finished.
class ParallelJobSet
{
 private:
   std::vector<std::function<void()>> Fs;
   unsigned max_threads_ = 0; // 0 => hardware_concurrency()

 public:
   ParallelJobSet()                      = default;
   ParallelJobSet(const ParallelJobSet&) = delete;
   ParallelJobSet(ParallelJobSet&&)      = default;
   ~ParallelJobSet()                     = default;
   ParallelJobSet& operator=(const ParallelJobSet&) = delete;
   ParallelJobSet& operator=(ParallelJobSet&&) = default;

   void reserve(size_t sz); // ensure capacity for jobs
   void set_max_threads(unsigned n) noexcept { max_threads_ = n; }
   size_t size() const noexcept { return Fs.size(); }

   void schedule(std::function<void()>);
   void execute() noexcept(false);              // Worker threads
   void execute_non_parallel() noexcept(false); // Doesn't use threads
};

} // namespace spindle
