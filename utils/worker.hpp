#ifndef UTILS_WORKER_HPP
#define UTILS_WORKER_HPP

#include <functional>
#include <string>
#include <thread>
#include <blockingconcurrentqueue.h>
#include "core/logging.hpp"

// Runs scheduled tasks one at a time on its own thread, in scheduling order.
// Exceptions thrown by a task are logged and do not stop the worker.
// The destructor finishes every task scheduled before it.
class Worker
{
public:
   using Task = std::function<void(void *)>;

   Worker(std::string name, void * data, ILogger & log);
   ~Worker();
   void ScheduleTask(Task item);

private:
   void Launch(void * arg);

   using Queue = moodycamel::BlockingConcurrentQueue<Task>;
   const std::string m_name;
   Queue * const m_queue;
   bool * const m_stop;
   ILogger & m_log;
   std::thread m_thread;
};

#endif // UTILS_WORKER_HPP
