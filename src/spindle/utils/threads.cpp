
#include "spindle/foundation.hpp"
#include "threads.hpp"

#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace spindle
{
unsigned hardware_concurrency()
{
   return std::max(1u, std::thread::hardware_concurrency());
}

// --------------------------------------------------------------- Parallel Jobs

void ParallelJobSet::reserve(size_t sz)
{
   if(Fs.size() < sz) Fs.reserve(sz);
}

void ParallelJobSet::schedule(std::function<void()> f)
{
   Fs.emplace_back(std::move(f));
}

void ParallelJobSet::execute_non_parallel()
{
   auto jobs = std::move(Fs);
   Fs.clear();
   for(auto& f : jobs) f();
}

void ParallelJobSet::execute()
{
   auto jobs        = std::move(Fs);
   const unsigned N = unsigned(jobs.size());
   Fs.clear();
   if(N == 0) return;

   const unsigned max_threads
       = (max_threads_ == 0) ? hardware_concurrency() : max_threads_;
   const unsigned n_threads = std::min(N, max_threads);

   std::atomic<unsigned> counter{0};
   std::mutex padlock;
   std::exception_ptr first_error = nullptr;

   auto run_jobs = [&]() {
      for(unsigned i = counter++; i < N; i = counter++) {
         try {
            jobs[i]();
         } catch(...) {
            std::lock_guard<decltype(padlock)> lock(padlock);
            if(!first_error) first_error = std::current_exception();
         }
      }
   };

   std::vector<std::thread> threads;
   threads.reserve(n_threads);
   for(unsigned n = 1; n < n_threads; ++n) threads.emplace_back(run_jobs);
   run_jobs(); // Re-uses the current thread
   for(auto& t : threads) t.join();

   if(first_error) std::rethrow_exception(first_error);
}

} // namespace spindle
