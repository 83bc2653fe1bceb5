#include <cstdlib>
#include <memory>
#include <stdexcept>
#include "utils/worker.hpp"

Worker::Worker(std::string name, void * data, ILogger & log)
   : m_name(std::move(name))
   , m_queue(new Queue(Queue::BLOCK_SIZE * 2))
   , m_stop(new bool(false))
   , m_log(log)
{
   Launch(data);
}

Worker::~Worker()
{
   ScheduleTask([stop = m_stop](void *) { *stop = true; });
   if (m_thread.joinable())
      m_thread.join();
}

void Worker::ScheduleTask(Worker::Task item)
{
   if (!m_queue->enqueue(std::move(item))) {
      m_log.Write<LogPriority::FATAL>(m_name, "failed to enqueue task");
      std::abort();
   }
}

void Worker::Launch(void * arg)
{
   m_thread = std::thread([queue = std::unique_ptr<Queue>(m_queue),
                           stop = std::unique_ptr<bool>(m_stop),
                           arg,
                           name = m_name,
                           &log = m_log] {
      log.Write<LogPriority::DEBUG>(name, "started");
      Worker::Task t;
      while (!*stop) {
         try {
            queue->wait_dequeue(t);
            t(arg);
         }
         catch (const std::exception & e) {
            log.Write<LogPriority::WARN>(name, "uncaught exception:", e.what());
         }
         catch (...) {
            log.Write<LogPriority::ERROR>(name, "uncaught exception: UNKNOWN");
         }
      }
      log.Write<LogPriority::DEBUG>(name, "shut down");
   });
}
